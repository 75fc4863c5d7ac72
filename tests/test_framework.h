/*
 * test_framework.h - Common test framework for the TagSmith test harness
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TEST_FRAMEWORK_H
#define TEST_FRAMEWORK_H

#include <string>
#include <vector>
#include <memory>
#include <iostream>
#include <sstream>
#include <exception>
#include <chrono>
#include <functional>
#include <cstdint>
#include <typeinfo>
#include <initializer_list>

namespace TestFramework {

    // ========================================
    // ASSERTION MACROS
    // ========================================
    
    /**
     * @brief Assert that a condition is true
     * @param condition Boolean condition to test
     * @param message Descriptive message for failure
     */
    #define ASSERT_TRUE(condition, message) \
        do { \
            if (!(condition)) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: true, Got: false"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    /**
     * @brief Assert that a condition is false
     * @param condition Boolean condition to test
     * @param message Descriptive message for failure
     */
    #define ASSERT_FALSE(condition, message) \
        do { \
            if ((condition)) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: false, Got: true"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    /**
     * @brief Assert that two values are equal
     * @param expected Expected value
     * @param actual Actual value
     * @param message Descriptive message for failure
     */
    #define ASSERT_EQUALS(expected, actual, message) \
        do { \
            if (!((expected) == (actual))) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: " << (expected) << ", Got: " << (actual); \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    /**
     * @brief Assert that a pointer is not null
     * @param ptr Pointer to test
     * @param message Descriptive message for failure
     */
    #define ASSERT_NOT_NULL(ptr, message) \
        do { \
            if ((ptr) == nullptr) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: non-null pointer, Got: null"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)
    
    /**
     * @brief Assert that a pointer is null
     * @param ptr Pointer to test
     * @param message Descriptive message for failure
     */
    #define ASSERT_NULL(ptr, message) \
        do { \
            if ((ptr) != nullptr) { \
                std::ostringstream oss; \
                oss << "ASSERTION FAILED: " << (message) \
                    << " at " << __FILE__ << ":" << __LINE__ \
                    << " - Expected: null pointer, Got: non-null"; \
                throw TestFramework::AssertionFailure(oss.str()); \
            } \
        } while(0)

    // ========================================
    // EXCEPTION CLASSES
    // ========================================
    
    /**
     * @brief Exception thrown when an assertion fails
     */
    class AssertionFailure : public std::exception {
    public:
        explicit AssertionFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };
    
    /**
     * @brief Exception thrown when a test setup fails
     */
    class TestSetupFailure : public std::exception {
    public:
        explicit TestSetupFailure(const std::string& message) : m_message(message) {}
        const char* what() const noexcept override { return m_message.c_str(); }
    private:
        std::string m_message;
    };

    // ========================================
    // TEST RESULT STRUCTURES
    // ========================================
    
    /**
     * @brief Enumeration of possible test results
     */
    enum class TestResult {
        PASSED,     ///< Test completed successfully
        FAILED,     ///< Test failed with assertion error
        ERROR,      ///< Test failed with unexpected error
        SKIPPED     ///< Test was skipped
    };
    
    /**
     * @brief Detailed information about a test execution
     */
    struct TestInfo {
        std::string name;                           ///< Test function name
        TestResult result;                          ///< Test result status
        std::string failure_message;                ///< Error message if failed
        std::chrono::milliseconds execution_time;   ///< Time taken to execute
        
        TestInfo(const std::string& test_name) 
            : name(test_name), result(TestResult::PASSED), execution_time(0) {}
    };

    // ========================================
    // TEST CASE BASE CLASS
    // ========================================
    
    /**
     * @brief Base class for individual test cases
     * 
     * Provides lifecycle management and standardized test execution.
     * Derived classes should override runTest() to implement test logic.
     */
    class TestCase {
    public:
        /**
         * @brief Constructor
         * @param name Human-readable name for this test case
         */
        explicit TestCase(const std::string& name);
        
        /**
         * @brief Virtual destructor
         */
        virtual ~TestCase() = default;
        
        /**
         * @brief Execute the test case with full lifecycle management
         * @return TestInfo containing execution results
         */
        TestInfo run();
        
        /**
         * @brief Get the test case name
         * @return Test case name
         */
        const std::string& getName() const;
        
        /**
         * @brief Check if the test passed
         * @return true if test completed successfully
         */
        bool hasPassed() const;
        
        /**
         * @brief Get failure messages from test execution
         * @return Vector of failure messages
         */
        const std::vector<std::string>& getFailures() const;
        
    protected:
        /**
         * @brief Override this method to implement test logic
         * 
         * This method should contain the actual test implementation.
         * Use the ASSERT_* macros to validate test conditions.
         */
        virtual void runTest() = 0;
        
        /**
         * @brief Optional setup method called before runTest()
         * 
         * Override to perform test-specific initialization.
         * Throw TestSetupFailure if setup cannot be completed.
         */
        virtual void setUp() {}
        
        /**
         * @brief Optional cleanup method called after runTest()
         * 
         * Override to perform test-specific cleanup.
         * This method is called even if the test fails.
         */
        virtual void tearDown() {}
        
        /**
         * @brief Add a custom failure message
         * @param message Failure message to record
         */
        void addFailure(const std::string& message);
        
    private:
        /**
         * @brief Run tearDown() after a failure, recording anything it throws
         */
        void safeTearDown();
        
        std::string m_name;                     ///< Test case name
        bool m_passed;                          ///< Whether test passed
        std::vector<std::string> m_failures;   ///< Collected failure messages
    };

    // ========================================
    // TEST SUITE CLASS
    // ========================================
    
    /**
     * @brief Container for multiple test cases with execution management
     * 
     * Manages a collection of test cases and provides batch execution
     * with comprehensive reporting.
     */
    class TestSuite {
    public:
        /**
         * @brief Constructor
         * @param name Name for this test suite
         */
        explicit TestSuite(const std::string& name);
        
        /**
         * @brief Add a test case to the suite
         * @param test Unique pointer to test case (takes ownership)
         */
        void addTest(std::unique_ptr<TestCase> test);
        
        /**
         * @brief Add a test function to the suite
         * @param name Test name
         * @param test_func Function pointer to test function
         */
        void addTest(const std::string& name, std::function<void()> test_func);
        
        /**
         * @brief Execute all tests in the suite
         * @return Vector of TestInfo results for each test
         */
        std::vector<TestInfo> runAll();
        /**
         * @brief Print comprehensive test results to stdout
         * @param results Vector of test results to print
         */
        void printResults(const std::vector<TestInfo>& results);
        
        /**
         * @brief Get count of failed tests from results
         * @param results Vector of test results
         * @return Number of failed tests
         */
        int getFailureCount(const std::vector<TestInfo>& results);
        
        /**
         * @brief Get count of passed tests from results
         * @param results Vector of test results
         * @return Number of passed tests
         */
        int getPassedCount(const std::vector<TestInfo>& results);
        
        /**
         * @brief Get total execution time from results
         * @param results Vector of test results
         * @return Total execution time in milliseconds
         */
        std::chrono::milliseconds getTotalTime(const std::vector<TestInfo>& results);
        
    private:
        std::string m_name;                                 ///< Suite name
        std::vector<std::unique_ptr<TestCase>> m_tests;    ///< Owned test cases
    };

    // ========================================
    // FUNCTION-BASED TEST WRAPPER
    // ========================================
    
    /**
     * @brief Wrapper to adapt function-based tests to TestCase interface
     */
    class FunctionTestCase : public TestCase {
    public:
        /**
         * @brief Constructor
         * @param name Test name
         * @param test_func Function to execute as test
         */
        FunctionTestCase(const std::string& name, std::function<void()> test_func);
        
    protected:
        void runTest() override;
        
    private:
        std::function<void()> m_test_func;
    };

    // ========================================
    // UTILITY FUNCTIONS FOR BYTE-LEVEL TESTING
    // ========================================
    
    /**
     * @brief Builders and checks for hand-assembled ID3 data
     */
    namespace ByteTestUtils {
        
        /**
         * @brief Bytes of a string literal, without its terminator
         */
        std::vector<uint8_t> bytes(const std::string& text);
        
        /**
         * @brief Concatenate byte blocks
         */
        std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts);
        
        /**
         * @brief Space-separated hex rendering, e.g. "49 44 33"
         */
        std::string hexDump(const std::vector<uint8_t>& data);
        
        /**
         * @brief Assert two byte vectors are identical, printing both in hex
         */
        void assertBytesEqual(const std::vector<uint8_t>& expected, const std::vector<uint8_t>& actual, const std::string& message);
        
        /**
         * @brief One frame: ID, size, flags, payload
         * @param version 2 for 6-byte headers, 3 for plain sizes, 4 for syncsafe sizes
         */
        std::vector<uint8_t> makeFrame(const std::string& id, const std::vector<uint8_t>& payload, uint8_t version, uint16_t flags = 0);
        
        /**
         * @brief A whole tag: 10-byte header followed by @p body
         */
        std::vector<uint8_t> makeTag(uint8_t version, const std::vector<uint8_t>& body, uint8_t flags = 0);
        
        /**
         * @brief Temporary file removed when the object goes out of scope
         */
        class TempFile {
        public:
            explicit TempFile(const std::vector<uint8_t>& contents);
            ~TempFile();
            TempFile(const TempFile&) = delete;
            TempFile& operator=(const TempFile&) = delete;
            
            const std::string& path() const { return m_path; }
            std::vector<uint8_t> contents() const;
            
        private:
            std::string m_path;
        };
    }

    // ========================================
    // COMMON TEST PATTERNS
    // ========================================
    
    /**
     * @brief Common test patterns and utilities
     */
    namespace TestPatterns {
        
        /**
         * @brief Test a function that should throw a specific exception
         * @param test_func Function to test
         * @param expected_message Expected exception message (optional)
         * @param message Descriptive message for failure
         */
        template<typename ExceptionType>
        void assertThrows(std::function<void()> test_func, const std::string& expected_message = "", const std::string& message = "Expected exception was not thrown") {
            bool exception_thrown = false;
            std::string actual_message;
            
            try {
                test_func();
            } catch (const ExceptionType& e) {
                exception_thrown = true;
                actual_message = e.what();
                
                if (!expected_message.empty() && actual_message.find(expected_message) == std::string::npos) {
                    std::ostringstream oss;
                    oss << "Exception message mismatch - Expected to contain: '" 
                        << expected_message << "', Got: '" << actual_message << "'";
                    throw AssertionFailure(oss.str());
                }
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << "Wrong exception type thrown - Expected: " << typeid(ExceptionType).name() 
                    << ", Got: " << typeid(e).name() << " with message: " << e.what();
                throw AssertionFailure(oss.str());
            }
            
            if (!exception_thrown) {
                throw AssertionFailure(message);
            }
        }
    }

} // namespace TestFramework

#endif // TEST_FRAMEWORK_H
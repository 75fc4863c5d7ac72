/*
 * test_framework.cpp - Implementation of common test framework for TagSmith
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "test_framework.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

namespace TestFramework {

    // ========================================
    // TEST CASE IMPLEMENTATION
    // ========================================
    
    TestCase::TestCase(const std::string& name) 
        : m_name(name), m_passed(false) {
    }
    
    TestInfo TestCase::run() {
        TestInfo info(m_name);
        auto start_time = std::chrono::high_resolution_clock::now();
        
        try {
            // Clear previous state
            m_passed = false;
            m_failures.clear();
            
            // Execute test lifecycle
            setUp();
            runTest();
            tearDown();
            
            // If we get here, test passed
            m_passed = true;
            info.result = TestResult::PASSED;
            
        } catch (const AssertionFailure& e) {
            m_passed = false;
            info.result = TestResult::FAILED;
            info.failure_message = e.what();
            addFailure(e.what());
            
            // Still call tearDown on assertion failure
            safeTearDown();
            
        } catch (const TestSetupFailure& e) {
            m_passed = false;
            info.result = TestResult::ERROR;
            info.failure_message = std::string("Setup failed: ") + e.what();
            addFailure(info.failure_message);
            
        } catch (const std::exception& e) {
            m_passed = false;
            info.result = TestResult::ERROR;
            info.failure_message = std::string("Unexpected error: ") + e.what();
            addFailure(info.failure_message);
            
            // Still call tearDown on unexpected error
            safeTearDown();
            
        } catch (...) {
            m_passed = false;
            info.result = TestResult::ERROR;
            info.failure_message = "Unknown exception occurred";
            addFailure(info.failure_message);
            
            // Still call tearDown on unknown error
            safeTearDown();
        }
        
        auto end_time = std::chrono::high_resolution_clock::now();
        info.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        
        return info;
    }
    
    const std::string& TestCase::getName() const {
        return m_name;
    }
    
    bool TestCase::hasPassed() const {
        return m_passed;
    }
    
    const std::vector<std::string>& TestCase::getFailures() const {
        return m_failures;
    }
    
    void TestCase::addFailure(const std::string& message) {
        m_failures.push_back(message);
    }
    
    void TestCase::safeTearDown() {
        try {
            tearDown();
        } catch (const std::exception& e) {
            addFailure(std::string("tearDown failed: ") + e.what());
        }
    }

    // ========================================
    // TEST SUITE IMPLEMENTATION
    // ========================================
    
    TestSuite::TestSuite(const std::string& name) : m_name(name) {
    }
    
    void TestSuite::addTest(std::unique_ptr<TestCase> test) {
        if (test) {
            m_tests.push_back(std::move(test));
        }
    }
    
    void TestSuite::addTest(const std::string& name, std::function<void()> test_func) {
        auto test_case = std::make_unique<FunctionTestCase>(name, test_func);
        addTest(std::move(test_case));
    }
    
    std::vector<TestInfo> TestSuite::runAll() {
        std::vector<TestInfo> results;
        results.reserve(m_tests.size());
        
        std::cout << "Running test suite: " << m_name << std::endl;
        std::cout << "===================" << std::string(m_name.length(), '=') << std::endl;
        
        for (auto& test : m_tests) {
            std::cout << "Running " << test->getName() << "... ";
            std::cout.flush();
            
            TestInfo result = test->run();
            results.push_back(result);
            
            // Print immediate result
            switch (result.result) {
                case TestResult::PASSED:
                    std::cout << "PASSED (" << result.execution_time.count() << "ms)" << std::endl;
                    break;
                case TestResult::FAILED:
                    std::cout << "FAILED (" << result.execution_time.count() << "ms)" << std::endl;
                    std::cout << "  Error: " << result.failure_message << std::endl;
                    break;
                case TestResult::ERROR:
                    std::cout << "ERROR (" << result.execution_time.count() << "ms)" << std::endl;
                    std::cout << "  Error: " << result.failure_message << std::endl;
                    break;
                case TestResult::SKIPPED:
                    std::cout << "SKIPPED" << std::endl;
                    break;
            }
        }
        
        return results;
    }
    
    void TestSuite::printResults(const std::vector<TestInfo>& results) {
        std::cout << std::endl;
        std::cout << "Test Results Summary" << std::endl;
        std::cout << "====================" << std::endl;
        
        int passed = getPassedCount(results);
        int failed = 0;
        int errors = 0;
        int skipped = 0;
        
        for (const auto& result : results) {
            if (result.result == TestResult::FAILED) failed++;
            else if (result.result == TestResult::ERROR) errors++;
            else if (result.result == TestResult::SKIPPED) skipped++;
        }
        
        std::cout << "Total tests: " << results.size() << std::endl;
        std::cout << "Passed: " << passed << std::endl;
        std::cout << "Failed: " << failed << std::endl;
        std::cout << "Errors: " << errors << std::endl;
        std::cout << "Skipped: " << skipped << std::endl;
        std::cout << "Total time: " << getTotalTime(results).count() << "ms" << std::endl;
        
        // Print detailed failure information
        if (failed > 0 || errors > 0) {
            std::cout << std::endl << "Failure Details:" << std::endl;
            std::cout << "================" << std::endl;
            
            for (const auto& result : results) {
                if (result.result == TestResult::FAILED || result.result == TestResult::ERROR) {
                    std::cout << std::endl << "FAILED: " << result.name << std::endl;
                    std::cout << "  " << result.failure_message << std::endl;
                }
            }
        }
        
        std::cout << std::endl;
        if (failed == 0 && errors == 0) {
            std::cout << "All tests passed!" << std::endl;
        } else {
            std::cout << "Some tests failed. See details above." << std::endl;
        }
    }
    
    int TestSuite::getFailureCount(const std::vector<TestInfo>& results) {
        return std::count_if(results.begin(), results.end(), 
            [](const TestInfo& info) {
                return info.result == TestResult::FAILED || info.result == TestResult::ERROR;
            });
    }
    
    int TestSuite::getPassedCount(const std::vector<TestInfo>& results) {
        return std::count_if(results.begin(), results.end(), 
            [](const TestInfo& info) { return info.result == TestResult::PASSED; });
    }
    
    std::chrono::milliseconds TestSuite::getTotalTime(const std::vector<TestInfo>& results) {
        std::chrono::milliseconds total(0);
        for (const auto& result : results) {
            total += result.execution_time;
        }
        return total;
    }

    // ========================================
    // FUNCTION TEST CASE IMPLEMENTATION
    // ========================================
    
    FunctionTestCase::FunctionTestCase(const std::string& name, std::function<void()> test_func)
        : TestCase(name), m_test_func(test_func) {
    }
    
    void FunctionTestCase::runTest() {
        if (m_test_func) {
            m_test_func();
        } else {
            throw TestSetupFailure("Test function is null");
        }
    }

    // ========================================
    // BYTE TEST UTILITIES IMPLEMENTATION
    // ========================================
    
    namespace ByteTestUtils {
        
        std::vector<uint8_t> bytes(const std::string& text) {
            return std::vector<uint8_t>(text.begin(), text.end());
        }
        
        std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
            std::vector<uint8_t> out;
            for (const auto& part : parts) {
                out.insert(out.end(), part.begin(), part.end());
            }
            return out;
        }
        
        std::string hexDump(const std::vector<uint8_t>& data) {
            std::ostringstream oss;
            oss << std::hex << std::setfill('0');
            for (size_t i = 0; i < data.size(); ++i) {
                if (i > 0) oss << ' ';
                oss << std::setw(2) << static_cast<int>(data[i]);
            }
            return oss.str();
        }
        
        void assertBytesEqual(const std::vector<uint8_t>& expected, const std::vector<uint8_t>& actual, const std::string& message) {
            if (expected != actual) {
                std::ostringstream oss;
                oss << "Byte mismatch: " << message
                    << " - Expected: [" << hexDump(expected) << "]"
                    << ", Got: [" << hexDump(actual) << "]";
                throw AssertionFailure(oss.str());
            }
        }
        
        std::vector<uint8_t> makeFrame(const std::string& id, const std::vector<uint8_t>& payload, uint8_t version, uint16_t flags) {
            std::vector<uint8_t> out(id.begin(), id.end());
            uint32_t size = static_cast<uint32_t>(payload.size());
            
            if (version == 2) {
                out.push_back(static_cast<uint8_t>((size >> 16) & 0xFF));
                out.push_back(static_cast<uint8_t>((size >> 8) & 0xFF));
                out.push_back(static_cast<uint8_t>(size & 0xFF));
            } else if (version == 4) {
                out.push_back(static_cast<uint8_t>((size >> 21) & 0x7F));
                out.push_back(static_cast<uint8_t>((size >> 14) & 0x7F));
                out.push_back(static_cast<uint8_t>((size >> 7) & 0x7F));
                out.push_back(static_cast<uint8_t>(size & 0x7F));
            } else {
                out.push_back(static_cast<uint8_t>((size >> 24) & 0xFF));
                out.push_back(static_cast<uint8_t>((size >> 16) & 0xFF));
                out.push_back(static_cast<uint8_t>((size >> 8) & 0xFF));
                out.push_back(static_cast<uint8_t>(size & 0xFF));
            }
            
            if (version != 2) {
                out.push_back(static_cast<uint8_t>(flags >> 8));
                out.push_back(static_cast<uint8_t>(flags & 0xFF));
            }
            
            out.insert(out.end(), payload.begin(), payload.end());
            return out;
        }
        
        std::vector<uint8_t> makeTag(uint8_t version, const std::vector<uint8_t>& body, uint8_t flags) {
            uint32_t size = static_cast<uint32_t>(body.size());
            std::vector<uint8_t> out = {
                'I', 'D', '3', version, 0, flags,
                static_cast<uint8_t>((size >> 21) & 0x7F),
                static_cast<uint8_t>((size >> 14) & 0x7F),
                static_cast<uint8_t>((size >> 7) & 0x7F),
                static_cast<uint8_t>(size & 0x7F)
            };
            out.insert(out.end(), body.begin(), body.end());
            return out;
        }
        
        TempFile::TempFile(const std::vector<uint8_t>& contents) {
            char name[] = "/tmp/tagsmith-test-XXXXXX";
            int fd = mkstemp(name);
            if (fd < 0) {
                throw TestSetupFailure("mkstemp failed");
            }
            m_path = name;
            
            size_t written = 0;
            while (written < contents.size()) {
                ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
                if (n <= 0) {
                    ::close(fd);
                    ::unlink(m_path.c_str());
                    throw TestSetupFailure("cannot write " + m_path);
                }
                written += static_cast<size_t>(n);
            }
            ::close(fd);
        }
        
        TempFile::~TempFile() {
            ::unlink(m_path.c_str());
        }
        
        std::vector<uint8_t> TempFile::contents() const {
            std::ifstream in(m_path, std::ios::binary);
            return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
    }

} // namespace TestFramework
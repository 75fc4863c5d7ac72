/*
 * debug.cpp - Debug output system implementation
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"
#include <ctime>

// Initialize static members
std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;
bool Debug::m_log_to_file = false;

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!logfile.empty()) {
        m_logfile.open(logfile, std::ios::out | std::ios::app);
        if (m_logfile.is_open()) {
            m_log_to_file = true;
        } else {
            std::cerr << "Could not open log file " << logfile << ", logging to stdout" << std::endl;
        }
    }
    m_enabled_channels.insert(channels.begin(), channels.end());
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile.close();
    }
    m_log_to_file = false;
    m_enabled_channels.clear();
}

bool Debug::isChannelEnabled(const std::string& channel) {
    if (m_enabled_channels.empty()) {
        return false;
    }
    // A global "all" channel can enable all logging.
    return m_enabled_channels.count("all") > 0 || m_enabled_channels.count(channel) > 0;
}

std::vector<std::string> Debug::parseChannelList(const std::string& list) {
    std::vector<std::string> channels;
    std::stringstream ss(list);
    std::string channel;
    while (std::getline(ss, channel, ',')) {
        if (!channel.empty()) {
            channels.push_back(channel);
        }
    }
    return channels;
}

std::string Debug::hexBytes(const uint8_t* data, size_t size, size_t max_bytes) {
    if (!data) {
        return "(null)";
    }
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    size_t shown = std::min(size, max_bytes);
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            ss << ' ';
        }
        ss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    if (shown < size) {
        ss << " ...";
    }
    return ss.str();
}

void Debug::write(const std::string& channel, const std::string& function, int line, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    auto timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt{};
    localtime_r(&timer, &bt);

    std::stringstream ss;
    ss << std::put_time(&bt, "%H:%M:%S") << '.' << std::dec << std::setfill('0') << std::setw(6) << us.count()
       << " [" << channel << "]: ";
    if (!function.empty()) {
        ss << function << ":" << line << ": ";
    }
    ss << message;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_log_to_file && m_logfile.is_open()) {
        m_logfile << ss.str() << std::endl;
    } else {
        std::cout << ss.str() << std::endl;
    }
}

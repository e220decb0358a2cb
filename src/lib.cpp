#include "lib.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>

// Two pass vsnprintf: first pass sizes the buffer, second one writes it.
std::string format_error(const char* msg, const char* file, int line, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args); // Make a copy for the second pass
    int required_size = std::vsnprintf(nullptr, 0, msg, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg, args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << buffer.data();
    return ss.str();
}

void error(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = format_error(msg.c_str(), file, line, args);
    va_end(args);
    throw std::runtime_error(text);
}

std::string quote_ident(const std::string& ident) {
    std::string out;
    out.reserve(ident.size() + 2);
    out += '"';
    for (char c : ident) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += '"';
    return out;
}

std::string zero_pad(int value, int width) {
    std::string s = std::to_string(value);
    if (static_cast<int>(s.size()) >= width) return s;
    return std::string(width - s.size(), '0') + s;
}

std::string file_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto us = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tm {};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y_%m_%d_%H_%M_%S") << "_" << std::setw(6) << std::setfill('0') << us;
    return ss.str();
}

std::string iso_timestamp() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm {};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

#include "Console.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace devsim::console {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kWhite = "\033[37m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[31m";

std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool>& colorFlag() {
    static std::atomic<bool> enabled{isatty(STDOUT_FILENO) != 0};
    return enabled;
}

void write(std::ostream& out, const char* color, const std::string& line) {
    std::lock_guard<std::mutex> lock(outputMutex());
    if (colorFlag().load()) {
        out << color << line << kReset << std::endl;
    } else {
        out << line << std::endl;
    }
}

} // namespace

void info(const std::string& line) {
    write(std::cout, kWhite, line);
}

void success(const std::string& line) {
    write(std::cout, kGreen, line);
}

void highlight(const std::string& line) {
    write(std::cout, kYellow, line);
}

void error(const std::string& line) {
    write(std::cerr, kRed, line);
}

void setColorEnabled(bool enabled) {
    colorFlag().store(enabled);
}

} // namespace devsim::console

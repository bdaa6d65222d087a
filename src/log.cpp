#include "aircast/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace aircast::log {

namespace {

std::atomic<bool> verbose_flag{false};
std::mutex out_lock;

void emit(std::ostream &out, std::string_view tag, const std::string &message) {
    std::lock_guard<std::mutex> lk(out_lock);
    out << "[" << tag << "] " << message << "\n";
    out.flush();
}

} // namespace

void set_verbose(bool on) {
    verbose_flag = on;
}

void info(std::string_view tag, const std::string &message) {
    emit(std::cout, tag, message);
}

void error(std::string_view tag, const std::string &message) {
    emit(std::cerr, tag, message);
}

void debug(std::string_view tag, const std::string &message) {
    if (verbose_flag) emit(std::cout, tag, message);
}

} // namespace aircast::log

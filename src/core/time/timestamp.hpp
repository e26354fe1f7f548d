#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace cmdtrust::core::time {

    // Local time as YYYY-MM-DDTHH:MM:SS.ffffff
    inline std::string now_iso8601() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                                now.time_since_epoch())
                                .count() %
                            1000000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setw(6) << std::setfill('0') << micros;
        return out.str();
    }

} // namespace cmdtrust::core::time

#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace hierfed {

// Wall-clock prefix shared by every log line, e.g. "12:04:55.318"
inline std::ostream &logTimestamp(std::ostream &os) {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  return os << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count() << std::setfill(' ');
}

} // namespace hierfed

// Always-on logging for round outcomes and rejections (works in release too)
#define LOG(msg) do { \
  std::cout << hierfed::logTimestamp << " [LOG] " << msg << std::endl; \
} while(0)

// Debug logging levels
#ifdef DEBUG_BUILD
  #define DEBUG_INFO(msg) do { \
    std::cout << hierfed::logTimestamp << " [INFO] " << msg << std::endl; \
  } while(0)

  #define DEBUG_DEBUG(msg) do { \
    std::cout << hierfed::logTimestamp << " [DEBUG] " << msg << std::endl; \
  } while(0)

  #define DEBUG_WARN(msg) do { \
    std::cerr << hierfed::logTimestamp << " [WARN] " << msg << std::endl; \
  } while(0)

  #define DEBUG_ERROR(msg) do { \
    std::cerr << hierfed::logTimestamp << " [ERROR] " << msg << std::endl; \
  } while(0)
#else
  // All debug macros become no-ops in release
  #define DEBUG_INFO(msg) ((void)0)
  #define DEBUG_DEBUG(msg) ((void)0)
  #define DEBUG_WARN(msg) ((void)0)
  #define DEBUG_ERROR(msg) ((void)0)
#endif

// Always log errors and exit (even in release)
#define LOG_AND_EXIT(msg, code) do { \
  std::cerr << hierfed::logTimestamp << " [FATAL] " << msg << std::endl; \
  std::exit(code); \
} while(0)

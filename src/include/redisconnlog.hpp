#pragma once
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace RedisConn {

  constexpr auto loggerName = "redisconn";

  inline std::once_flag loggerSetup;

  /**
   * @brief Access the library-wide logger
   *
   * @return A shared pointer to the `redisconn` spdlog logger
   *
   * @details The logger is created on first use with a coloured stdout sink. If the application has
   * already registered a logger under the same name (e.g. one writing to a file) that logger is used
   * instead, so the library's output can be redirected without any change to library code.
   *
   */
  inline std::shared_ptr<spdlog::logger> log() {
    std::call_once(loggerSetup, [] {
      if (spdlog::get(loggerName) == nullptr) {
        auto logger = spdlog::stdout_color_mt(loggerName);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
        logger->set_level(spdlog::level::info);
      }
    });
    return spdlog::get(loggerName);
  }

  /**
   * @brief Set the library log level by name
   *
   * @param level One of `trace`, `debug`, `info`, `warn`, `error`, `critical` or `off`
   *
   * @details `spdlog::level::from_str` maps any unknown name to `off`; an unknown name is reported and the
   * level is left unchanged instead.
   *
   */
  inline void setLogLevel(std::string_view level) {
    auto name = std::string(level);
    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
      log()->warn("unknown log level '{}', keeping '{}'", name, spdlog::level::to_string_view(log()->level()));
      return;
    }
    log()->set_level(parsed);
  }
};  // namespace RedisConn

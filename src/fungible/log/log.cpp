#include <fungible/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace fungible::log {

void initialize( quill::LogLevel level ) noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( fungible::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
  instance()->set_log_level( level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

} // namespace fungible::log

#include "config.hpp"

#include <gflags/gflags.h>

#include <algorithm>

DEFINE_int32(max_concurrency, 3, "Maximum number of simultaneous downloads");
DEFINE_int32(max_retries, 3,
             "Automatic retries of a download after a network error");
DEFINE_int32(retry_base_delay_ms, 1000,
             "First retry delay, doubled on every further retry");
DEFINE_int32(retry_max_delay_ms, 60000, "Upper bound of the retry delay");
DEFINE_int32(stall_timeout_sec, 30,
             "A transfer without progress for this long is a network error");
DEFINE_int32(connect_timeout_sec, 15, "Connection timeout");
DEFINE_int32(progress_interval_ms, 250,
             "Minimum interval between two progress events of one download");
DEFINE_bool(write_info_json, false,
            "Write <file>.info.json with the media metadata after a download");
DEFINE_int32(event_buffer_size, 256,
             "Per-observer event buffer before progress events are dropped");
DEFINE_string(download_dir, ".", "Default destination directory");
DEFINE_string(state_file, "",
              "Job table file; empty disables persistence across restarts");
DEFINE_int32(autosave_interval_sec, 10, "Periodic job table save interval");
DEFINE_string(ytdlp_path, "yt-dlp", "Media extractor executable");
DEFINE_string(browser_helper, "",
              "Page rendering helper: <helper> <url> <cookie-file>");
DEFINE_int32(resolve_timeout_sec, 120, "Timeout of a single URL resolution");
DEFINE_string(credentials_file, "",
              "JSON file with per-platform cookies and headers");
DEFINE_string(preferred_resolution, "best", "\"best\" or e.g. \"720p\"");
DEFINE_string(preferred_container, "", "e.g. \"mp4\"; empty accepts any");
DEFINE_string(log_dir, "logs", "Log directory; empty disables the log file");
DEFINE_string(log_level, "info", "debug, info, warn, error or fatal");
DEFINE_bool(log_to_console, true, "Copy log records to the console");
DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. transfer:8,resolve:4");

namespace utils {

Config LoadConfigFromFlags() {
  Config cfg;
  cfg.maxConcurrency =
      std::clamp(FLAGS_max_concurrency, 1, kMaxConcurrencyCeiling);
  cfg.maxRetries = std::max(0, FLAGS_max_retries);
  cfg.retryBaseDelay =
      std::chrono::milliseconds(std::max(0, FLAGS_retry_base_delay_ms));
  cfg.retryMaxDelay = std::chrono::milliseconds(
      std::max(FLAGS_retry_base_delay_ms, FLAGS_retry_max_delay_ms));
  cfg.stallTimeout = std::chrono::seconds(std::max(1, FLAGS_stall_timeout_sec));
  cfg.connectTimeout =
      std::chrono::seconds(std::max(1, FLAGS_connect_timeout_sec));
  cfg.progressInterval =
      std::chrono::milliseconds(std::max(0, FLAGS_progress_interval_ms));
  cfg.writeInfoJson = FLAGS_write_info_json;
  cfg.eventBufferSize =
      static_cast<size_t>(std::max(1, FLAGS_event_buffer_size));
  cfg.downloadDir = FLAGS_download_dir;
  cfg.stateFile = FLAGS_state_file;
  cfg.autosaveInterval =
      std::chrono::seconds(std::max(1, FLAGS_autosave_interval_sec));
  cfg.ytdlpPath = FLAGS_ytdlp_path;
  cfg.browserHelper = FLAGS_browser_helper;
  cfg.resolveTimeout =
      std::chrono::seconds(std::max(1, FLAGS_resolve_timeout_sec));
  cfg.credentialsFile = FLAGS_credentials_file;
  cfg.preferredResolution = FLAGS_preferred_resolution;
  cfg.preferredContainer = FLAGS_preferred_container;

  cfg.log.logFilePath = FLAGS_log_dir;
  cfg.log.minLevel = ParseLogLevel(FLAGS_log_level);
  cfg.log.toConsole = FLAGS_log_to_console;
  return cfg;
}

}  // namespace utils

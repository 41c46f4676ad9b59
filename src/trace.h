#pragma once

#include "phase.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace husk {

namespace trace_events {

struct phase_start {
  phase value;
};

struct phase_complete {
  phase value;
  std::int64_t duration_ms;
};

struct file_discovered {
  std::string path;
  std::string kind;  // "manifest" or "config"
};

struct directory_excluded {
  std::string path;
};

struct file_skipped {
  std::string path;
  std::string reason;
};

struct manifest_sanitized {
  std::string manifest;
  std::string role;  // "package" or "workspace"
  std::int64_t target_count;
};

struct manifest_rejected {
  std::string manifest;
  std::string reason;
};

struct filter_decision {
  std::string path;
  bool is_directory;
  bool kept;
};

struct lock_file_missing {
  std::string path;
};

struct output_written {
  std::string path;
  std::string source;  // "filter", "lock", "manifest" or "stub"
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::phase_start,
                                   trace_events::phase_complete,
                                   trace_events::file_discovered,
                                   trace_events::directory_excluded,
                                   trace_events::file_skipped,
                                   trace_events::manifest_sanitized,
                                   trace_events::manifest_rejected,
                                   trace_events::filter_decision,
                                   trace_events::lock_file_missing,
                                   trace_events::output_written>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

struct phase_trace_scope {
  phase value;
  std::chrono::steady_clock::time_point start;

  explicit phase_trace_scope(phase phase_value);
  ~phase_trace_scope();
};

}  // namespace husk

#define HUSK_TRACE_UNLIKELY [[unlikely]]

#define HUSK_TRACE_EMIT(event_expr) \
  do { \
    if (::husk::tui::g_trace_enabled) HUSK_TRACE_UNLIKELY { \
        ::husk::tui::trace event_expr; \
      } \
  } while (0)

#define HUSK_TRACE_PHASE_START(phase_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::phase_start{ \
      .value = (phase_value), \
  }))

#define HUSK_TRACE_PHASE_COMPLETE(phase_value, duration_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::phase_complete{ \
      .value = (phase_value), \
      .duration_ms = (duration_value), \
  }))

#define HUSK_TRACE_FILE_DISCOVERED(path_value, kind_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::file_discovered{ \
      .path = (path_value), \
      .kind = (kind_value), \
  }))

#define HUSK_TRACE_DIRECTORY_EXCLUDED(path_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::directory_excluded{ \
      .path = (path_value), \
  }))

#define HUSK_TRACE_FILE_SKIPPED(path_value, reason_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::file_skipped{ \
      .path = (path_value), \
      .reason = (reason_value), \
  }))

#define HUSK_TRACE_MANIFEST_SANITIZED(manifest_value, role_value, target_count_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::manifest_sanitized{ \
      .manifest = (manifest_value), \
      .role = (role_value), \
      .target_count = (target_count_value), \
  }))

#define HUSK_TRACE_MANIFEST_REJECTED(manifest_value, reason_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::manifest_rejected{ \
      .manifest = (manifest_value), \
      .reason = (reason_value), \
  }))

#define HUSK_TRACE_FILTER_DECISION(path_value, is_directory_value, kept_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::filter_decision{ \
      .path = (path_value), \
      .is_directory = (is_directory_value), \
      .kept = (kept_value), \
  }))

#define HUSK_TRACE_LOCK_FILE_MISSING(path_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::lock_file_missing{ \
      .path = (path_value), \
  }))

#define HUSK_TRACE_OUTPUT_WRITTEN(path_value, source_value) \
  HUSK_TRACE_EMIT((::husk::trace_events::output_written{ \
      .path = (path_value), \
      .source = (source_value), \
  }))

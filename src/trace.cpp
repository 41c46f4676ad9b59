#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace husk {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};

#if defined(_WIN32)
  gmtime_s(&result, &time);
#else
  gmtime_r(&time, &result);
#endif

  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

phase_trace_scope::phase_trace_scope(phase phase_value)
    : value{ phase_value }, start{ std::chrono::steady_clock::now() } {
  HUSK_TRACE_PHASE_START(value);
}

phase_trace_scope::~phase_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  HUSK_TRACE_PHASE_COMPLETE(value, static_cast<std::int64_t>(duration_ms));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(phase_start),
          TRACE_NAME(phase_complete),
          TRACE_NAME(file_discovered),
          TRACE_NAME(directory_excluded),
          TRACE_NAME(file_skipped),
          TRACE_NAME(manifest_sanitized),
          TRACE_NAME(manifest_rejected),
          TRACE_NAME(filter_decision),
          TRACE_NAME(lock_file_missing),
          TRACE_NAME(output_written),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::phase_start const &value) {
            std::ostringstream oss;
            oss << "phase_start phase=" << phase_name(value.value);
            return oss.str();
          },
          [](trace_events::phase_complete const &value) {
            std::ostringstream oss;
            oss << "phase_complete phase=" << phase_name(value.value)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::file_discovered const &value) {
            std::ostringstream oss;
            oss << "file_discovered path=" << value.path << " kind=" << value.kind;
            return oss.str();
          },
          [](trace_events::directory_excluded const &value) {
            std::ostringstream oss;
            oss << "directory_excluded path=" << value.path;
            return oss.str();
          },
          [](trace_events::file_skipped const &value) {
            std::ostringstream oss;
            oss << "file_skipped path=" << value.path << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::manifest_sanitized const &value) {
            std::ostringstream oss;
            oss << "manifest_sanitized manifest=" << value.manifest
                << " role=" << value.role << " target_count=" << value.target_count;
            return oss.str();
          },
          [](trace_events::manifest_rejected const &value) {
            std::ostringstream oss;
            oss << "manifest_rejected manifest=" << value.manifest
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::filter_decision const &value) {
            std::ostringstream oss;
            oss << "filter_decision path=" << value.path
                << " is_directory=" << bool_string(value.is_directory)
                << " kept=" << bool_string(value.kept);
            return oss.str();
          },
          [](trace_events::lock_file_missing const &value) {
            std::ostringstream oss;
            oss << "lock_file_missing path=" << value.path;
            return oss.str();
          },
          [](trace_events::output_written const &value) {
            std::ostringstream oss;
            oss << "output_written path=" << value.path << " source=" << value.source;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::phase_start const &value) {
            append_kv(output, "phase", phase_name(value.value));
          },
          [&](trace_events::phase_complete const &value) {
            append_kv(output, "phase", phase_name(value.value));
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::file_discovered const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "kind", value.kind);
          },
          [&](trace_events::directory_excluded const &value) {
            append_kv(output, "path", value.path);
          },
          [&](trace_events::file_skipped const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::manifest_sanitized const &value) {
            append_kv(output, "manifest", value.manifest);
            append_kv(output, "role", value.role);
            append_kv(output, "target_count", value.target_count);
          },
          [&](trace_events::manifest_rejected const &value) {
            append_kv(output, "manifest", value.manifest);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::filter_decision const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "is_directory", value.is_directory);
            append_kv(output, "kept", value.kept);
          },
          [&](trace_events::lock_file_missing const &value) {
            append_kv(output, "path", value.path);
          },
          [&](trace_events::output_written const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "source", value.source);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace husk

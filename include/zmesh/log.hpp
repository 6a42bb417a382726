/**
 * @file log.hpp
 * @brief zmesh logging: tagged, leveled, printf-style records with a swappable sink.
 *
 * @details
 * Every module logs through the `ZMESH_LOG*` macros with a short tag naming
 * the module (`frame`, `controller`, `mlswitch`, ...). Records below the
 * current level are discarded before formatting.
 *
 * The default sink prints one `key=value` line per record on stderr so the
 * output reads like the rest of the tooling:
 * ```
 * level=warn tag=mlswitch msg="Command 0x06 not implemented."
 * ```
 *
 * Tests and embedding applications may replace the sink with `set_sink()`.
 * All functions are safe to call from several threads.
 *
 * @par Example
 * @code
 * zmesh::log::set_level(zmesh::log::Level::Debug);
 * ZMESH_LOGD("controller", "node=%u added", unsigned(id));
 * @endcode
 */
#ifndef ZMESH_LOG_HPP
#define ZMESH_LOG_HPP

#include <stdint.h>
#include <functional>
#include <string>

namespace zmesh {
namespace log {

/// Severity, lowest first. `Off` silences everything.
enum class Level : uint8_t { Trace = 0, Debug, Info, Warn, Error, Off };

/// Receives one fully formatted record.
using Sink = std::function<void(Level level, const char* tag, const char* msg)>;

/// Longest formatted message; longer records are truncated.
static constexpr size_t LOG_LINE_MAX = 256;

void  set_level(Level level);
Level level();

/// True if a record at @p level would be emitted.
bool enabled(Level level);

/**
 * @brief Parse a level name (`trace`, `debug`, `info`, `warn`, `error`, `off`).
 * @return false on an unknown name; @p out is left untouched.
 */
bool parse_level(const std::string& name, Level& out);

/// Lowercase name of a level, e.g. "warn".
const char* level_name(Level level);

/// Replace the output sink. An empty function restores the stderr sink.
void set_sink(Sink sink);
void reset_sink();

/// Format and emit one record. Prefer the macros below.
void write(Level level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace log
} // namespace zmesh

#define ZMESH_LOGT(tag, ...) ::zmesh::log::write(::zmesh::log::Level::Trace, tag, __VA_ARGS__)
#define ZMESH_LOGD(tag, ...) ::zmesh::log::write(::zmesh::log::Level::Debug, tag, __VA_ARGS__)
#define ZMESH_LOGI(tag, ...) ::zmesh::log::write(::zmesh::log::Level::Info,  tag, __VA_ARGS__)
#define ZMESH_LOGW(tag, ...) ::zmesh::log::write(::zmesh::log::Level::Warn,  tag, __VA_ARGS__)
#define ZMESH_LOGE(tag, ...) ::zmesh::log::write(::zmesh::log::Level::Error, tag, __VA_ARGS__)

#endif // ZMESH_LOG_HPP

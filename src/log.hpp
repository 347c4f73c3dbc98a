#ifndef PDFMASK_LOG_HPP
#define PDFMASK_LOG_HPP

#include <sstream>
#include <string>

namespace pdfmask {

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel log_level();
// "debug", "info", "warn" or "error"; anything else keeps the current level.
bool set_log_level(const std::string &name);

// One line on stderr: [pdfmask] LEVEL stage=<stage> <message>
void log_event(LogLevel level, const char *stage, const std::string &message);

// Builds "message key=value key=value" for log_event.
class LogLine {
public:
    explicit LogLine(const std::string &message) { os_ << message; }
    template <typename T>
    LogLine &kv(const char *key, const T &value) {
        os_ << ' ' << key << '=' << value;
        return *this;
    }
    std::string str() const { return os_.str(); }

private:
    std::ostringstream os_;
};

inline void log_debug(const char *stage, const std::string &m) { log_event(LogLevel::Debug, stage, m); }
inline void log_info(const char *stage, const std::string &m) { log_event(LogLevel::Info, stage, m); }
inline void log_warn(const char *stage, const std::string &m) { log_event(LogLevel::Warn, stage, m); }
inline void log_error(const char *stage, const std::string &m) { log_event(LogLevel::Error, stage, m); }

} // namespace pdfmask

#endif // PDFMASK_LOG_HPP

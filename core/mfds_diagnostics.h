#ifndef mfds_diagnostics_h
#define mfds_diagnostics_h

/// @file

#include "mfds_config.h"
#include "mfds_common.h"

#include <iosfwd>
#include <sstream>
#include <string>
#include <vector>

/** @brief
 * A sink for messages produced while scanning and loading.
 *
 * @details
 * The scan and load operations report through a diagnostics object passed
 * in by the caller rather than writing to a global stream. Every message is
 * recorded. Messages with a level at or below the verbosity are also
 * forwarded to the output stream, formatted like MFDS_ERROR et al.
 * Process wide defaults (verbosity, stream) are chosen by the application.
 */
class MFDS_EXPORT mfds_diagnostics
{
public:
    /// message severity, lower is more severe
    enum
    {
        error = 0,
        warning = 1,
        notice = 2,
        info = 3,
        debug = 4
    };

    /// a recorded message
    struct record
    {
        int level;
        std::string file;
        int line;
        std::string message;
    };

    /// construct with verbosity set to warning, forwarding to std::cerr
    mfds_diagnostics();

    /** construct with the given verbosity and output stream. a nullptr
     * stream disables forwarding.
     */
    mfds_diagnostics(int verbosity, std::ostream *os);

    mfds_diagnostics(const mfds_diagnostics &) = delete;
    void operator=(const mfds_diagnostics &) = delete;

    /// set the most verbose level that is forwarded to the stream
    void set_verbosity(int level) { m_verbosity = level; }
    int get_verbosity() const { return m_verbosity; }

    /// set the stream messages are forwarded to, nullptr to disable
    void set_stream(std::ostream *os) { m_stream = os; }

    /// record a message and forward it if the level is enabled
    void report(int level, const char *file, int line, const std::string &msg);

    /// returns the number of recorded messages at the given level
    size_t count(int level) const;

    /// returns true if any recorded message at level contains the text
    bool contains(int level, const std::string &text) const;

    /// access the recorded messages
    const std::vector<record> &get_records() const { return m_records; }

    /// discard all recorded messages
    void clear() { m_records.clear(); }

    /// returns the name of the level
    static const char *get_level_name(int level);

private:
    int m_verbosity;
    std::ostream *m_stream;
    std::vector<record> m_records;
};

/// report a message at the given level into the diagnostics sink
#define MFDS_DIAG(_diag, _level, _msg)                          \
{                                                               \
    std::ostringstream dss;                                     \
    dss << "" _msg;                                             \
    (_diag).report(_level, __FILE__, __LINE__, dss.str());      \
}

#define MFDS_DIAG_ERROR(_diag, _msg) \
    MFDS_DIAG(_diag, mfds_diagnostics::error, _msg)

#define MFDS_DIAG_WARNING(_diag, _msg) \
    MFDS_DIAG(_diag, mfds_diagnostics::warning, _msg)

#define MFDS_DIAG_NOTICE(_diag, _msg) \
    MFDS_DIAG(_diag, mfds_diagnostics::notice, _msg)

#define MFDS_DIAG_INFO(_diag, _msg) \
    MFDS_DIAG(_diag, mfds_diagnostics::info, _msg)

#define MFDS_DIAG_DEBUG(_diag, _msg) \
    MFDS_DIAG(_diag, mfds_diagnostics::debug, _msg)

#endif

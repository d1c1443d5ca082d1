#include "mfds_diagnostics.h"

#include <iostream>

// --------------------------------------------------------------------------
mfds_diagnostics::mfds_diagnostics() :
    m_verbosity(mfds_diagnostics::warning), m_stream(&std::cerr)
{}

// --------------------------------------------------------------------------
mfds_diagnostics::mfds_diagnostics(int verbosity, std::ostream *os) :
    m_verbosity(verbosity), m_stream(os)
{}

// --------------------------------------------------------------------------
const char *mfds_diagnostics::get_level_name(int level)
{
    switch (level)
    {
    case error: return "ERROR:";
    case warning: return "WARNING:";
    case notice: return "NOTICE:";
    case info: return "INFO:";
    case debug: return "DEBUG:";
    }
    return "MESSAGE:";
}

// --------------------------------------------------------------------------
void mfds_diagnostics::report(int level, const char *file, int line,
    const std::string &msg)
{
    m_records.push_back(record{level, file, line, msg});

    if (!m_stream || (level > m_verbosity))
        return;

    const char *color = ANSI_WHITE;
    switch (level)
    {
    case error: color = ANSI_RED; break;
    case warning: color = ANSI_YELLOW; break;
    case notice: color = ANSI_GREEN; break;
    default: color = ANSI_BLUE; break;
    }

    const char *head = mfds_diagnostics::get_level_name(level);

    std::ostringstream oss;
    oss << BEGIN_HL(color) << head << END_HL
        << " " << mfds_parallel_id() << " [" << file << ":" << line
        << " " << MFDS_VERSION_DESCR << "]" << std::endl
        << BEGIN_HL(color) << head << END_HL << " "
        << BEGIN_HL(ANSI_WHITE) << msg << END_HL << std::endl;

    *m_stream << oss.str();
}

// --------------------------------------------------------------------------
size_t mfds_diagnostics::count(int level) const
{
    size_t n = 0;
    size_t n_recs = m_records.size();
    for (size_t i = 0; i < n_recs; ++i)
    {
        if (m_records[i].level == level)
            ++n;
    }
    return n;
}

// --------------------------------------------------------------------------
bool mfds_diagnostics::contains(int level, const std::string &text) const
{
    size_t n_recs = m_records.size();
    for (size_t i = 0; i < n_recs; ++i)
    {
        if ((m_records[i].level == level) &&
            (m_records[i].message.find(text) != std::string::npos))
            return true;
    }
    return false;
}

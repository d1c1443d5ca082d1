#include "mfds_pre_regex.h"
#include "mfds_common.h"
#include "mfds_diagnostics.h"
#include "mfds_string_util.h"
#include "mfds_file_util.h"
#include "mfds_binary_stream.h"

#include <cstdio>
#include <cstring>
#include <regex>
#include <sstream>

// **************************************************************************
void mfds_element_values::merge(const mfds_element_values &other)
{
    int of = other.flags;
    if (of & has_year) year = other.year;
    if (of & has_month) month = other.month;
    if (of & has_day) day = other.day;
    if (of & has_hour) hour = other.hour;
    if (of & has_minute) minute = other.minute;
    if (of & has_second) second = other.second;
    if (of & has_doy) doy = other.doy;
    if (of & has_value) value = other.value;
    if (of & has_index) index = other.index;
    if (of & has_text) text = other.text;
    flags |= of;
}

// **************************************************************************
int mfds_element_values::get_date(mfds_date &date, std::string &errstr) const
{
    date = mfds_date();

    if (flags & has_year)
        date.year = year;

    if (flags & has_doy)
    {
        if (mfds_calendar_util::day_of_year_to_date(date.year, doy,
            date.month, date.day))
        {
            errstr = "day of year " + std::to_string(doy) + " is out of range";
            return -1;
        }
    }
    else
    {
        if (flags & has_month)
            date.month = month;
        if (flags & has_day)
            date.day = day;
    }

    if (flags & has_hour)
    {
        date.hour = hour;
        date.minute = 0;
    }

    if (flags & has_minute)
        date.minute = minute;

    if (flags & has_second)
        date.second = second;

    return mfds_calendar_util::validate(date, errstr);
}

namespace
{
// **************************************************************************
template <typename num_t>
int parse_number(const std::string &text, num_t &val)
{
    return mfds_string_util::string_tt<num_t>::convert(text.c_str(), val);
}

// **************************************************************************
mfds_element_parser int_field_parser(int mfds_element_values::*field, int flag)
{
    return [field, flag](const std::string &text, mfds_element_values &vals) -> int
    {
        int tmp = 0;
        if (parse_number(text, tmp))
            return -1;
        vals.*field = tmp;
        vals.flags |= flag;
        return 0;
    };
}

// **************************************************************************
mfds_element_formatter int_field_formatter(int mfds_element_values::*field,
    int flag, int width)
{
    return [field, flag, width](const mfds_element_values &vals,
        std::string &text) -> int
    {
        if (!(vals.flags & flag))
            return -1;
        char buf[32];
        snprintf(buf, sizeof(buf), "%0*d", width, vals.*field);
        text = buf;
        return 0;
    };
}

const char *month_names[] = {"january", "february", "march", "april",
    "may", "june", "july", "august", "september", "october", "november",
    "december"};

// **************************************************************************
std::string escape_literal(const std::string &text)
{
    std::string out;
    size_t n = text.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (strchr("\\^$.|?*+()[]{}", text[i]))
            out += '\\';
        out += text[i];
    }
    return out;
}

// **************************************************************************
int count_groups(const std::string &re)
{
    int n_groups = 0;
    bool in_bracket = false;
    size_t n = re.size();
    for (size_t i = 0; i < n; ++i)
    {
        char c = re[i];
        if (c == '\\')
        {
            ++i;
        }
        else if (in_bracket)
        {
            if (c == ']')
                in_bracket = false;
        }
        else if (c == '[')
        {
            in_bracket = true;
        }
        else if ((c == '(') && ((i + 1 >= n) || (re[i+1] != '?')))
        {
            ++n_groups;
        }
    }
    return n_groups;
}

// **************************************************************************
bool contains_regex_tokens(const std::string &lit)
{
    size_t n = lit.size();
    for (size_t i = 0; i < n; ++i)
    {
        char c = lit[i];
        if (c == '\\')
        {
            // escaped punctuation is literal, character classes are not
            if ((i + 1 < n) && isalpha(static_cast<unsigned char>(lit[i+1])))
                return true;
            ++i;
        }
        else if (strchr("^$.|?*+()[]{}", c))
        {
            return true;
        }
    }
    return false;
}
};

// --------------------------------------------------------------------------
mfds_element_registry::mfds_element_registry()
{
    // indices and numbers
    this->add("idx", "\\d*",
        [](const std::string &text, mfds_element_values &vals) -> int
        {
            long tmp = 0;
            if (parse_number(text, tmp))
                return -1;
            vals.index = tmp;
            vals.value = tmp;
            vals.flags |= mfds_element_values::has_index|mfds_element_values::has_value;
            return 0;
        },
        [](const mfds_element_values &vals, std::string &text) -> int
        {
            if (!(vals.flags & mfds_element_values::has_index))
                return -1;
            text = std::to_string(vals.index);
            return 0;
        });

    this->add("value", "[-+]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][-+]?\\d+)?",
        [](const std::string &text, mfds_element_values &vals) -> int
        {
            double tmp = 0.0;
            if (parse_number(text, tmp))
                return -1;
            vals.value = tmp;
            vals.flags |= mfds_element_values::has_value;
            return 0;
        },
        [](const mfds_element_values &vals, std::string &text) -> int
        {
            if (!(vals.flags & mfds_element_values::has_value))
                return -1;
            std::ostringstream oss;
            oss << vals.value;
            text = oss.str();
            return 0;
        });

    // date fields
    using ev = mfds_element_values;

    this->add("Y", "\\d\\d\\d\\d", int_field_parser(&ev::year, ev::has_year),
        int_field_formatter(&ev::year, ev::has_year, 4));

    this->add("yy", "\\d\\d",
        [](const std::string &text, mfds_element_values &vals) -> int
        {
            int tmp = 0;
            if (parse_number(text, tmp))
                return -1;
            // POSIX convention for the century
            vals.year = tmp + (tmp < 69 ? 2000 : 1900);
            vals.flags |= mfds_element_values::has_year;
            return 0;
        },
        [](const mfds_element_values &vals, std::string &text) -> int
        {
            if (!(vals.flags & mfds_element_values::has_year))
                return -1;
            char buf[8];
            snprintf(buf, sizeof(buf), "%02d", vals.year % 100);
            text = buf;
            return 0;
        });

    const char *month_elts[] = {"m", "mm"};
    const char *day_elts[] = {"d", "dd"};
    const char *doy_elts[] = {"j", "doy"};
    for (int i = 0; i < 2; ++i)
    {
        this->add(month_elts[i], "\\d?\\d", int_field_parser(&ev::month, ev::has_month),
            int_field_formatter(&ev::month, ev::has_month, 2));

        this->add(day_elts[i], "\\d?\\d", int_field_parser(&ev::day, ev::has_day),
            int_field_formatter(&ev::day, ev::has_day, 2));

        this->add(doy_elts[i], "\\d?\\d?\\d", int_field_parser(&ev::doy, ev::has_doy),
            int_field_formatter(&ev::doy, ev::has_doy, 3));
    }

    this->add("H", "\\d\\d", int_field_parser(&ev::hour, ev::has_hour),
        int_field_formatter(&ev::hour, ev::has_hour, 2));

    this->add("min", "\\d\\d", int_field_parser(&ev::minute, ev::has_minute),
        int_field_formatter(&ev::minute, ev::has_minute, 2));

    this->add("S", "\\d\\d",
        [](const std::string &text, mfds_element_values &vals) -> int
        {
            int tmp = 0;
            if (parse_number(text, tmp))
                return -1;
            vals.second = tmp;
            vals.flags |= mfds_element_values::has_second;
            return 0;
        },
        [](const mfds_element_values &vals, std::string &text) -> int
        {
            if (!(vals.flags & mfds_element_values::has_second))
                return -1;
            char buf[8];
            snprintf(buf, sizeof(buf), "%02d", int(vals.second));
            text = buf;
            return 0;
        });

    // month names, B is kept as an alias of M
    mfds_element_parser month_parser =
        [](const std::string &text, mfds_element_values &vals) -> int
        {
            std::string name(text);
            mfds_file_util::to_lower(name);
            for (int i = 0; i < 12; ++i)
            {
                if ((name == month_names[i]) ||
                    ((name.size() == 3) && !strncmp(name.c_str(), month_names[i], 3)))
                {
                    vals.month = i + 1;
                    vals.flags |= mfds_element_values::has_month;
                    return 0;
                }
            }
            return -1;
        };

    mfds_element_formatter month_formatter =
        [](const mfds_element_values &vals, std::string &text) -> int
        {
            if (!(vals.flags & mfds_element_values::has_month) ||
                (vals.month < 1) || (vals.month > 12))
                return -1;
            text = month_names[vals.month-1];
            return 0;
        };

    this->add("M", "[a-zA-Z]*", month_parser, month_formatter);
    this->add("B", "[a-zA-Z]+", month_parser, month_formatter);

    // free text
    mfds_element_parser text_parser =
        [](const std::string &text, mfds_element_values &vals) -> int
        {
            vals.text = text;
            vals.flags |= mfds_element_values::has_text;
            return 0;
        };

    mfds_element_formatter text_formatter =
        [](const mfds_element_values &vals, std::string &text) -> int
        {
            if (!(vals.flags & mfds_element_values::has_text))
                return -1;
            text = vals.text;
            return 0;
        };

    this->add("text", "[a-zA-Z]*", text_parser, text_formatter);
    this->add("char", "\\S*", text_parser, text_formatter);

    // composites
    mfds_element x;
    x.name = "x";
    x.parts = {{"Y", ""}, {"m", "\\d\\d"}, {"d", "\\d\\d"}};
    this->add(x);

    mfds_element X;
    X.name = "X";
    X.parts = {{"H", ""}, {"min", ""}, {"S", ""}};
    this->add(X);

    mfds_element F;
    F.name = "F";
    F.parts = {{"Y", ""}, {"", "-"}, {"m", ""}, {"", "-"}, {"d", ""}};
    this->add(F);
}

// --------------------------------------------------------------------------
mfds_element_registry &mfds_element_registry::get_global()
{
    static mfds_element_registry reg;
    return reg;
}

// --------------------------------------------------------------------------
int mfds_element_registry::add(const mfds_element &elt, bool replace)
{
    if (elt.name.empty())
    {
        MFDS_ERROR("An element must have a name")
        return -1;
    }

    if (!replace && m_elements.count(elt.name))
    {
        MFDS_ERROR("Element \"" << elt.name << "\" is already registered")
        return -1;
    }

    mfds_element tmp(elt);
    if (tmp.is_composite())
    {
        // the regex is the concatenation of the parts
        tmp.pattern.clear();
        size_t n_parts = tmp.parts.size();
        for (size_t i = 0; i < n_parts; ++i)
        {
            mfds_element::part &p = tmp.parts[i];
            if (p.element.empty())
            {
                tmp.pattern += escape_literal(p.pattern);
                continue;
            }

            const mfds_element *pelt = this->get(p.element);
            if (!pelt || pelt->is_composite())
            {
                MFDS_ERROR("Element \"" << p.element << "\" of composite \""
                    << elt.name << "\" is not a registered simple element")
                return -1;
            }

            if (p.pattern.empty())
                p.pattern = pelt->pattern;

            tmp.pattern += "(?:" + p.pattern + ")";
        }
    }
    else if (!tmp.parser)
    {
        MFDS_ERROR("Element \"" << elt.name << "\" has no parser")
        return -1;
    }

    m_elements[tmp.name] = tmp;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_element_registry::add(const std::string &name,
    const std::string &pattern, const mfds_element_parser &parser,
    const mfds_element_formatter &formatter, bool replace)
{
    mfds_element elt;
    elt.name = name;
    elt.pattern = pattern;
    elt.parser = parser;
    elt.formatter = formatter;
    return this->add(elt, replace);
}

// --------------------------------------------------------------------------
const mfds_element *mfds_element_registry::get(const std::string &name) const
{
    std::map<std::string, mfds_element>::const_iterator it =
        m_elements.find(name);

    if (it == m_elements.end())
        return nullptr;

    return &it->second;
}

// --------------------------------------------------------------------------
int mfds_element_registry::get_pattern(const std::string &name,
    std::string &pattern) const
{
    const mfds_element *elt = this->get(name);
    if (!elt)
        return -1;

    pattern = elt->pattern;
    return 0;
}

// --------------------------------------------------------------------------
int mfds_element_registry::parse(const std::string &name,
    const std::string &text, mfds_element_values &vals) const
{
    const mfds_element *elt = this->get(name);
    if (!elt)
    {
        MFDS_ERROR("No element named \"" << name << "\"")
        return -1;
    }

    if (!elt->is_composite())
        return elt->parser(text, vals);

    // match again, this time capturing each part
    std::string re;
    size_t n_parts = elt->parts.size();
    for (size_t i = 0; i < n_parts; ++i)
    {
        const mfds_element::part &p = elt->parts[i];
        if (p.element.empty())
            re += escape_literal(p.pattern);
        else
            re += "(" + p.pattern + ")";
    }

    std::smatch m;
    try
    {
        std::regex rex(re);
        if (!std::regex_match(text, m, rex))
            return -1;
    }
    catch (std::regex_error &e)
    {
        MFDS_ERROR("Failed to compile the regex of element \"" << name
            << "\". " << mfds_file_util::regex_strerr(e.code()))
        return -1;
    }

    int group = 0;
    for (size_t i = 0; i < n_parts; ++i)
    {
        const mfds_element::part &p = elt->parts[i];
        if (p.element.empty())
            continue;

        ++group;
        if (this->parse(p.element, m[group].str(), vals))
            return -1;

        // custom sub-regex of the part may hold groups
        group += count_groups(p.pattern);
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_element_registry::format(const std::string &name,
    const mfds_element_values &vals, std::string &text) const
{
    const mfds_element *elt = this->get(name);
    if (!elt)
    {
        MFDS_ERROR("No element named \"" << name << "\"")
        return -1;
    }

    if (!elt->is_composite())
    {
        if (!elt->formatter)
            return -1;
        return elt->formatter(vals, text);
    }

    text.clear();
    size_t n_parts = elt->parts.size();
    for (size_t i = 0; i < n_parts; ++i)
    {
        const mfds_element::part &p = elt->parts[i];
        if (p.element.empty())
        {
            text += p.pattern;
            continue;
        }

        std::string tmp;
        if (this->format(p.element, vals, tmp))
            return -1;
        text += tmp;
    }

    return 0;
}

// --------------------------------------------------------------------------
std::vector<std::string> mfds_element_registry::get_names() const
{
    std::vector<std::string> names;
    for (const auto &kv : m_elements)
        names.push_back(kv.first);
    return names;
}



struct mfds_pre_regex::internals_t
{
    internals_t() : compiled(false) {}

    bool compiled;
    std::regex regex;
    mfds_element_registry elements;
};

// --------------------------------------------------------------------------
mfds_pre_regex::mfds_pre_regex() : m_internals(new internals_t),
    m_n_groups(0), m_has_regex_tokens(false)
{}

// --------------------------------------------------------------------------
mfds_pre_regex::~mfds_pre_regex()
{}

// --------------------------------------------------------------------------
mfds_pre_regex::mfds_pre_regex(const mfds_pre_regex &other) :
    m_internals(new internals_t(*other.m_internals)),
    m_pre_regex(other.m_pre_regex), m_regex(other.m_regex),
    m_matchers(other.m_matchers), m_segments(other.m_segments),
    m_n_groups(other.m_n_groups), m_has_regex_tokens(other.m_has_regex_tokens)
{}

// --------------------------------------------------------------------------
mfds_pre_regex &mfds_pre_regex::operator=(const mfds_pre_regex &other)
{
    if (this != &other)
    {
        m_internals.reset(new internals_t(*other.m_internals));
        m_pre_regex = other.m_pre_regex;
        m_regex = other.m_regex;
        m_matchers = other.m_matchers;
        m_segments = other.m_segments;
        m_n_groups = other.m_n_groups;
        m_has_regex_tokens = other.m_has_regex_tokens;
    }
    return *this;
}

// --------------------------------------------------------------------------
bool mfds_pre_regex::is_compiled() const
{
    return m_internals->compiled;
}

// --------------------------------------------------------------------------
int mfds_pre_regex::compile(const std::string &pre_regex,
    mfds_diagnostics &diag)
{
    return this->compile(pre_regex, std::map<std::string, std::string>(),
        mfds_element_registry::get_global(), diag);
}

// --------------------------------------------------------------------------
int mfds_pre_regex::compile(const std::string &pre,
    const std::map<std::string, std::string> &replacements,
    const mfds_element_registry &elements, mfds_diagnostics &diag)
{
    m_internals->compiled = false;
    m_internals->elements = elements;
    m_pre_regex = pre;
    m_regex.clear();
    m_matchers.clear();
    m_segments.clear();
    m_n_groups = 0;
    m_has_regex_tokens = false;

    std::string lit;
    size_t n = pre.size();
    size_t i = 0;
    while (i < n)
    {
        char c = pre[i];
        if ((c == '\\') && (i + 1 < n))
        {
            lit += pre.substr(i, 2);
            i += 2;
            continue;
        }

        if (c != '%')
        {
            lit += c;
            ++i;
            continue;
        }

        if ((i + 1 < n) && (pre[i+1] == '%'))
        {
            lit += '%';
            i += 2;
            continue;
        }

        if ((i + 1 >= n) || (pre[i+1] != '('))
        {
            MFDS_DIAG_ERROR(diag, "Malformed matcher at position " << i
                << " in pre-regex \"" << pre << "\", '%' must be followed"
                " by '(' or '%'")
            return mfds_error::config_error;
        }

        m_has_regex_tokens |= contains_regex_tokens(lit);
        m_regex += lit;
        lit.clear();

        size_t start = i;
        i += 2;

        // coordinate name
        size_t b = i;
        while ((i < n) && (pre[i] != ':') && (pre[i] != ')'))
            ++i;

        mfds_matcher m;
        m.coord = pre.substr(b, i - b);

        while ((i < n) && (pre[i] == ':'))
        {
            ++i;
            if (pre.compare(i, 7, "custom=") == 0)
            {
                i += 7;
                size_t e = pre.find(':', i);
                if (e == std::string::npos)
                {
                    MFDS_DIAG_ERROR(diag, "Unterminated custom regex in matcher"
                        " at position " << start << " in pre-regex \"" << pre
                        << "\", custom regexes end with ':'")
                    return mfds_error::config_error;
                }
                m.custom = pre.substr(i, e - i);
                i = e + 1;
                continue;
            }

            b = i;
            while ((i < n) && (pre[i] != ':') && (pre[i] != ')'))
                ++i;

            std::string tok = pre.substr(b, i - b);
            if (tok == "dummy")
            {
                m.dummy = true;
            }
            else if (m.element.empty() && !m.dummy && m.custom.empty() && !tok.empty())
            {
                m.element = tok;
            }
            else
            {
                MFDS_DIAG_ERROR(diag, "Malformed matcher at position " << start
                    << " in pre-regex \"" << pre << "\", unexpected \""
                    << tok << "\"")
                return mfds_error::config_error;
            }
        }

        if ((i >= n) || (pre[i] != ')'))
        {
            MFDS_DIAG_ERROR(diag, "Unterminated matcher at position " << start
                << " in pre-regex \"" << pre << "\"")
            return mfds_error::config_error;
        }
        ++i;

        if (m.coord.empty())
        {
            MFDS_DIAG_ERROR(diag, "Matcher at position " << start
                << " in pre-regex \"" << pre << "\" has no coordinate name")
            return mfds_error::config_error;
        }

        std::map<std::string, std::string>::const_iterator rit =
            replacements.find(m.coord);
        if (rit != replacements.end())
        {
            m_regex += escape_literal(rit->second);
            continue;
        }

        if (m.element.empty())
            m.element = "idx";

        if (m_internals->elements.get_pattern(m.element, m.pattern))
        {
            MFDS_DIAG_ERROR(diag, "Unknown element \"" << m.element
                << "\" in matcher at position " << start << " in pre-regex \""
                << pre << "\"")
            return mfds_error::config_error;
        }

        if (!m.custom.empty())
            m.pattern = m.custom;

        m.index = m_matchers.size();
        m.group = count_groups(m_regex) + 1;
        m_regex += "(" + m.pattern + ")";

        m_matchers.push_back(m);
    }

    m_has_regex_tokens |= contains_regex_tokens(lit);
    m_regex += lit;
    m_n_groups = count_groups(m_regex);

    try
    {
        m_internals->regex = std::regex(m_regex);
    }
    catch (std::regex_error &e)
    {
        MFDS_DIAG_ERROR(diag, "The regex \"" << m_regex << "\" compiled from \""
            << pre << "\" is invalid. " << mfds_file_util::regex_strerr(e.code()))
        return mfds_error::config_error;
    }

    MFDS_DIAG_DEBUG(diag, "Compiled pre-regex \"" << pre << "\" to \""
        << m_regex << "\" with " << m_matchers.size() << " matchers")

    m_internals->compiled = true;
    return 0;
}

// --------------------------------------------------------------------------
std::vector<int> mfds_pre_regex::get_matchers_of(const std::string &coord) const
{
    std::vector<int> ids;
    size_t n = m_matchers.size();
    for (size_t i = 0; i < n; ++i)
    {
        if (m_matchers[i].coord == coord)
            ids.push_back(i);
    }
    return ids;
}

// --------------------------------------------------------------------------
int mfds_pre_regex::match(const std::string &filename,
    std::vector<std::string> &captures) const
{
    if (!m_internals->compiled)
    {
        MFDS_ERROR("The pre-regex has not been compiled")
        return -1;
    }

    std::smatch m;
    if (!std::regex_match(filename, m, m_internals->regex))
        return -1;

    size_t n = m_matchers.size();
    captures.resize(n);
    for (size_t i = 0; i < n; ++i)
    {
        int g = m_matchers[i].group;
        captures[i] = m[g].str();
    }

    return 0;
}

// --------------------------------------------------------------------------
int mfds_pre_regex::set_segments(const std::string &filename)
{
    if (!m_internals->compiled)
    {
        MFDS_ERROR("The pre-regex has not been compiled")
        return -1;
    }

    std::smatch m;
    if (!std::regex_match(filename, m, m_internals->regex))
        return -1;

    m_segments.clear();

    size_t prev = 0;
    size_t n = m_matchers.size();
    for (size_t i = 0; i < n; ++i)
    {
        int g = m_matchers[i].group;
        size_t pos = m.position(g);
        m_segments.push_back(filename.substr(prev, pos - prev));
        prev = pos + m.length(g);
    }
    m_segments.push_back(filename.substr(prev));

    return 0;
}

// --------------------------------------------------------------------------
int mfds_pre_regex::make_filename(const std::vector<std::string> &captures,
    std::string &filename) const
{
    if (m_segments.empty())
    {
        MFDS_ERROR("Segments are needed to make a filename, no file matched")
        return -1;
    }

    if (captures.size() != m_matchers.size())
    {
        MFDS_ERROR("Making a filename requires " << m_matchers.size()
            << " captures, " << captures.size() << " given")
        return -1;
    }

    filename = m_segments[0];

    size_t n = m_matchers.size();
    for (size_t i = 0; i < n; ++i)
        filename += captures[i] + m_segments[i+1];

    return 0;
}

// --------------------------------------------------------------------------
int mfds_pre_regex::parse(int matcher_id, const std::string &text,
    mfds_element_values &vals) const
{
    const mfds_matcher &m = m_matchers[matcher_id];
    if (m_internals->elements.parse(m.element, text, vals))
    {
        MFDS_ERROR("Failed to parse \"" << text << "\" as element \""
            << m.element << "\" of coordinate \"" << m.coord << "\"")
        return -1;
    }
    return 0;
}

// --------------------------------------------------------------------------
int mfds_pre_regex::format(int matcher_id, const mfds_element_values &vals,
    std::string &text) const
{
    const mfds_matcher &m = m_matchers[matcher_id];
    return m_internals->elements.format(m.element, vals, text);
}

// --------------------------------------------------------------------------
void mfds_pre_regex::to_stream(mfds_binary_stream &bs) const
{
    bs.pack(m_pre_regex);
    bs.pack(m_regex);
    unsigned long n = m_matchers.size();
    bs.pack(n);
    for (unsigned long i = 0; i < n; ++i)
    {
        const mfds_matcher &m = m_matchers[i];
        bs.pack(m.coord);
        bs.pack(m.element);
        bs.pack(m.custom);
        bs.pack(m.dummy);
        bs.pack(m.group);
    }
    bs.pack(m_segments);
}

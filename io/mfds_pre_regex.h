#ifndef mfds_pre_regex_h
#define mfds_pre_regex_h

/// @file

#include "mfds_config.h"
#include "mfds_calendar_util.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

class mfds_diagnostics;
class mfds_binary_stream;

/** @brief
 * The values extracted from the text captured by a matcher.
 *
 * @details
 * The flags record which fields were set. Values of several matchers are
 * combined with merge, for instance a year, a month and a day captured by
 * three matchers of the same coordinate.
 */
struct MFDS_EXPORT mfds_element_values
{
    enum
    {
        has_year = 0x001,
        has_month = 0x002,
        has_day = 0x004,
        has_hour = 0x008,
        has_minute = 0x010,
        has_second = 0x020,
        has_doy = 0x040,
        has_value = 0x080,
        has_index = 0x100,
        has_text = 0x200,
        date_mask = 0x07f
    };

    mfds_element_values() : flags(0), year(1970), month(1), day(1),
        hour(12), minute(0), second(0.0), doy(1), value(0.0), index(0) {}

    /// copy the fields set in other
    void merge(const mfds_element_values &other);

    /// true if any of the date fields is set
    bool has_date() const { return flags & date_mask; }

    /** the date, fields not set take the default 1970-01-01 12:00:00.
     * returns non-zero if the fields do not make a valid date.
     */
    int get_date(mfds_date &date, std::string &errstr) const;

    int flags;
    int year;
    int month;
    int day;
    int hour;
    int minute;
    double second;
    int doy;
    double value;
    long index;
    std::string text;
};

/// converts captured text to element values, returns non-zero on error
using mfds_element_parser =
    std::function<int(const std::string&, mfds_element_values&)>;

/// converts element values to text, returns non-zero on error
using mfds_element_formatter =
    std::function<int(const mfds_element_values&, std::string&)>;

/** @brief
 * An element of a matcher: the kind of text it matches and how that text
 * is interpreted.
 *
 * @details
 * A simple element has a sub-regex and a parser. A composite element is a
 * sequence of parts, each either another element (with its own sub-regex)
 * or literal text. A composite matches the concatenation of its parts and
 * is parsed by parsing each of its element parts.
 */
struct MFDS_EXPORT mfds_element
{
    /// a part of a composite element, element is empty for literal text
    struct part
    {
        std::string element;
        std::string pattern;
    };

    bool is_composite() const { return !parts.empty(); }

    std::string name;
    std::string pattern;
    mfds_element_parser parser;
    mfds_element_formatter formatter;
    std::vector<part> parts;
};

/** @brief
 * Elements available to matchers, by name.
 *
 * @details
 * The built in elements are
 *
 * | Name     | Matches |
 * |----------|---------|
 * | idx      | an index, possibly empty |
 * | value    | a signed decimal or floating point number |
 * | Y        | a four digit year |
 * | yy       | a two digit year, before 69 is in the 2000s |
 * | m, mm    | a month number |
 * | d, dd    | a day of the month |
 * | j, doy   | a day of the year |
 * | H, min, S | two digit hour, minute, second |
 * | M, B     | a month name, or its three letter abbreviation |
 * | text     | letters |
 * | char     | any non white space |
 * | x        | %Y%m%d, eight digits |
 * | X        | %H%min%S |
 * | F        | %Y-%m-%d |
 */
class MFDS_EXPORT mfds_element_registry
{
public:
    /// construct with the built in elements
    mfds_element_registry();

    /// the registry used when none is given
    static mfds_element_registry &get_global();

    /** add an element. parts of a composite that name elements must
     * already be registered. returns non-zero if the name is in use and
     * replace is false, or if the element is invalid.
     */
    int add(const mfds_element &elt, bool replace = false);

    /// add a simple element
    int add(const std::string &name, const std::string &pattern,
        const mfds_element_parser &parser,
        const mfds_element_formatter &formatter = nullptr,
        bool replace = false);

    /// returns the element or nullptr if it is not known
    const mfds_element *get(const std::string &name) const;

    /// the regular expression matched by the element, without captures
    int get_pattern(const std::string &name, std::string &pattern) const;

    /// convert text matched by the element into values
    int parse(const std::string &name, const std::string &text,
        mfds_element_values &vals) const;

    /// convert values to text the element would match
    int format(const std::string &name, const mfds_element_values &vals,
        std::string &text) const;

    /// names of the registered elements
    std::vector<std::string> get_names() const;

private:
    std::map<std::string, mfds_element> m_elements;
};

/// a placeholder of the pre-regex
struct MFDS_EXPORT mfds_matcher
{
    mfds_matcher() : dummy(false), group(-1), index(-1) {}

    std::string coord;
    std::string element;
    std::string custom;
    std::string pattern;
    bool dummy;

    /// the capture group
    int group;

    /// the position in the list of matchers
    int index;
};

/** @brief
 * The pre-regex compiler.
 *
 * @details
 * A pre-regex is a regular expression in which the varying parts of the
 * filenames are written as matchers:
 *
 *     %(coord[:element][:custom=<regex>:][:dummy])
 *
 * The element defaults to idx. A custom regex is terminated by a colon.
 * Dummy matchers must match and may vary from file to file but carry no
 * value, their text is captured only to rebuild filenames. %% is a
 * literal %. Matchers whose coordinate has
 * a constant replacement are replaced by the constant text.
 *
 * Once compiled, filenames are matched from their start. The first matched
 * filename defines the segments, the text between the captures, from
 * which filenames are rebuilt given the captures.
 */
class MFDS_EXPORT mfds_pre_regex
{
public:
    mfds_pre_regex();
    ~mfds_pre_regex();

    mfds_pre_regex(const mfds_pre_regex &other);
    mfds_pre_regex &operator=(const mfds_pre_regex &other);

    /** compile the pre-regex. returns mfds_error::config_error, after
     * reporting to diag, if the syntax is malformed, an element is unknown
     * or the resulting regular expression is rejected.
     */
    int compile(const std::string &pre_regex,
        const std::map<std::string, std::string> &replacements,
        const mfds_element_registry &elements, mfds_diagnostics &diag);

    int compile(const std::string &pre_regex, mfds_diagnostics &diag);

    /// true after a successful compile
    bool is_compiled() const;

    const std::string &get_pre_regex() const { return m_pre_regex; }
    const std::string &get_regex() const { return m_regex; }
    const std::vector<mfds_matcher> &get_matchers() const { return m_matchers; }

    /// the number of capture groups
    int get_n_groups() const { return m_n_groups; }

    /// the index of the matchers bound to the coordinate
    std::vector<int> get_matchers_of(const std::string &coord) const;

    /** true if the literal text outside of matchers contains regular
     * expression tokens. such text is frozen from the first matched file.
     */
    bool has_regex_tokens() const { return m_has_regex_tokens; }

    /** match the filename from its start. the text captured by each matcher
     * is returned. returns non-zero if the filename does not match.
     */
    int match(const std::string &filename,
        std::vector<std::string> &captures) const;

    /** record the segments from a filename. returns non-zero if it does
     * not match.
     */
    int set_segments(const std::string &filename);

    bool has_segments() const { return !m_segments.empty(); }
    const std::vector<std::string> &get_segments() const { return m_segments; }

    /// rebuild a filename from the text of each matcher, indexed like the matchers
    int make_filename(const std::vector<std::string> &captures,
        std::string &filename) const;

    /// convert the text captured by a matcher into values
    int parse(int matcher_id, const std::string &text,
        mfds_element_values &vals) const;

    /// convert values to the text a matcher would capture
    int format(int matcher_id, const mfds_element_values &vals,
        std::string &text) const;

    /// serialize the compiled state and segments
    void to_stream(mfds_binary_stream &bs) const;

private:
    struct internals_t;
    std::unique_ptr<internals_t> m_internals;

    std::string m_pre_regex;
    std::string m_regex;
    std::vector<mfds_matcher> m_matchers;
    std::vector<std::string> m_segments;
    int m_n_groups;
    bool m_has_regex_tokens;
};

#endif

#ifndef mfds_numeric_coordinate_h
#define mfds_numeric_coordinate_h

/// @file

#include "mfds_config.h"
#include "mfds_coordinate.h"
#include "mfds_calendar_util.h"

#include <memory>
#include <string>
#include <vector>

class mfds_numeric_coordinate;
using p_mfds_numeric_coordinate = std::shared_ptr<mfds_numeric_coordinate>;

class mfds_time_coordinate;
using p_mfds_time_coordinate = std::shared_ptr<mfds_time_coordinate>;

/// A coordinate with strictly increasing floating point values
class MFDS_EXPORT mfds_numeric_coordinate : public mfds_coordinate
{
public:
    static p_mfds_numeric_coordinate New()
    { return p_mfds_numeric_coordinate(new mfds_numeric_coordinate); }

    static p_mfds_numeric_coordinate New(const std::string &name,
        const std::string &units = "");

    ~mfds_numeric_coordinate() override {}

    const char *get_type_name() const override { return "numeric"; }
    p_mfds_coordinate new_copy() const override;
    bool is_string() const override { return false; }
    long get_size() const override { return m_values.size(); }

    int set_values(const std::vector<double> &values) override;
    const std::vector<double> &get_values() const override { return m_values; }

    int get_index(double value, long &idx, int loc = closest) const override;
    int subset(double vmin, double vmax, mfds_key &key) const override;

    void to_stream(mfds_binary_stream &bs) const override;
    int from_stream(mfds_binary_stream &bs) override;

    void print(std::ostream &os) const override;

protected:
    mfds_numeric_coordinate() = default;
    mfds_numeric_coordinate(const mfds_numeric_coordinate &) = default;

protected:
    std::vector<double> m_values;
};

/** @brief
 * A numeric coordinate whose units are of the form "<unit> since <date>".
 *
 * @details
 * Values convert to and from dates in the standard (proleptic Gregorian)
 * calendar.
 */
class MFDS_EXPORT mfds_time_coordinate : public mfds_numeric_coordinate
{
public:
    static p_mfds_time_coordinate New()
    { return p_mfds_time_coordinate(new mfds_time_coordinate); }

    static p_mfds_time_coordinate New(const std::string &name,
        const std::string &units);

    ~mfds_time_coordinate() override {}

    const char *get_type_name() const override { return "time"; }
    p_mfds_coordinate new_copy() const override;
    bool is_time() const override { return true; }

    /// convert a date to a value in the units of the coordinate
    int get_value_of_date(const mfds_date &date, double &value) const;

    /// get the date of the i-th value
    int get_date(long i, mfds_date &date) const;

    /// locate a date, see get_index
    int get_index_of_date(const mfds_date &date, long &idx,
        int loc = closest) const;

    void print(std::ostream &os) const override;

protected:
    mfds_time_coordinate() = default;
    mfds_time_coordinate(const mfds_time_coordinate &) = default;
};

#endif

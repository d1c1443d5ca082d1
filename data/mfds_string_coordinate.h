#ifndef mfds_string_coordinate_h
#define mfds_string_coordinate_h

/// @file

#include "mfds_config.h"
#include "mfds_coordinate.h"

#include <memory>
#include <string>
#include <vector>

class mfds_string_coordinate;
using p_mfds_string_coordinate = std::shared_ptr<mfds_string_coordinate>;

/** A coordinate holding names, used for the variable dimension. The names
 * are kept in the order they are given and are never sorted.
 */
class MFDS_EXPORT mfds_string_coordinate : public mfds_coordinate
{
public:
    static p_mfds_string_coordinate New()
    { return p_mfds_string_coordinate(new mfds_string_coordinate); }

    static p_mfds_string_coordinate New(const std::string &name);

    ~mfds_string_coordinate() override {}

    const char *get_type_name() const override { return "string"; }
    p_mfds_coordinate new_copy() const override;
    bool is_string() const override { return true; }
    long get_size() const override { return m_names.size(); }

    /// returns non-zero if a name is repeated
    int set_names(const std::vector<std::string> &names) override;
    const std::vector<std::string> &get_names() const override
    { return m_names; }

    int get_index_of_name(const std::string &name, long &idx) const override;
    std::string get_name_of_index(long i) const override;

    void to_stream(mfds_binary_stream &bs) const override;
    int from_stream(mfds_binary_stream &bs) override;

    void print(std::ostream &os) const override;

protected:
    mfds_string_coordinate() = default;
    mfds_string_coordinate(const mfds_string_coordinate &) = default;

private:
    std::vector<std::string> m_names;
};

#endif

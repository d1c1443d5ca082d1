#ifndef mfds_load_command_h
#define mfds_load_command_h

/// @file

#include "mfds_config.h"
#include "mfds_keyring.h"

#include <iosfwd>
#include <string>
#include <vector>

/** @brief
 * A pair of keyrings: what to read in the file and where to place it in
 * memory.
 *
 * @details
 * Both keyrings have the same dimensions and their keys select the same
 * number of elements, the i-th element read is placed at the i-th element
 * of the memory selection. An in-file key of type none marks a dimension
 * not represented in the file.
 */
struct MFDS_EXPORT mfds_command_keys
{
    mfds_command_keys() = default;
    mfds_command_keys(const mfds_keyring &a_infile, const mfds_keyring &a_memory)
        : infile(a_infile), memory(a_memory) {}

    bool operator==(const mfds_command_keys &other) const
    { return (infile == other.infile) && (memory == other.memory); }

    mfds_keyring infile;
    mfds_keyring memory;
};

/** @brief
 * The reads to do in one file.
 *
 * @details
 * A command is built with one pair of keyrings per combination of values
 * found in the file, holding lists. merge combines pairs that differ along
 * a single dimension until no more can be combined, simplify then rewrites
 * the lists as integers or slices.
 */
class MFDS_EXPORT mfds_load_command
{
public:
    mfds_load_command() = default;
    explicit mfds_load_command(const std::string &filename)
        : m_filename(filename) {}

    void set_filename(const std::string &filename) { m_filename = filename; }
    const std::string &get_filename() const { return m_filename; }

    /// add a pair of keyrings
    void add_keys(const mfds_keyring &infile, const mfds_keyring &memory)
    { m_keys.emplace_back(infile, memory); }

    void add_keys(const mfds_command_keys &keys)
    { m_keys.push_back(keys); }

    size_t size() const { return m_keys.size(); }
    bool empty() const { return m_keys.empty(); }

    const mfds_command_keys &get_keys(size_t i) const { return m_keys[i]; }
    mfds_command_keys &get_keys(size_t i) { return m_keys[i]; }

    const std::vector<mfds_command_keys> &get_keys() const { return m_keys; }

    /** combine pairs that differ along exactly one dimension, in the file
     * and in memory, into a single pair of list keys. repeated until no
     * pair can be combined. identical pairs are dropped. returns non-zero
     * if the keys can not be appended.
     */
    int merge();

    /** rewrite lists of one element as integers and other lists as slices
     * where possible. selections running backward in the file are reversed
     * along with their memory selection so that the file is read forward.
     */
    void simplify();

    /// order the keys of every pair
    void sort_by(const std::vector<std::string> &dims);

    /** split into one command per variable. the in-file key of the
     * variable dimension becomes a single name in each command.
     */
    int separate_variables(const std::string &var_dim,
        std::vector<mfds_load_command> &commands) const;

    bool operator==(const mfds_load_command &other) const
    { return (m_filename == other.m_filename) && (m_keys == other.m_keys); }

private:
    std::string m_filename;
    std::vector<mfds_command_keys> m_keys;
};

/** send the command to the stream, eg.
 *
 *     ssh_2007.nc
 *         {time: slice(0, 5, 2), depth: 0} -> {time: slice(0, 3, 1), depth: 0}
 */
MFDS_EXPORT
std::ostream &operator<<(std::ostream &os, const mfds_load_command &cmd);

#endif

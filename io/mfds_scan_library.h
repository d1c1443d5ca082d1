#ifndef mfds_scan_library_h
#define mfds_scan_library_h

/// @file

#include "mfds_config.h"
#include "mfds_pre_regex.h"
#include "mfds_file_format.h"

#include <functional>
#include <string>
#include <vector>

class mfds_coordinate;
class mfds_diagnostics;

/** @brief
 * The values found for a coordinate in one file.
 *
 * @details
 * Numeric coordinates fill values, string coordinates fill names. The
 * in-file indices locate each value inside the file, -1 when the
 * coordinate is not represented inside the file. For the variable
 * dimension in_names holds the name of each variable in the file.
 */
struct MFDS_EXPORT mfds_scan_result
{
    std::vector<double> values;
    std::vector<std::string> names;
    std::vector<long> in_idx;
    std::vector<std::string> in_names;

    /// the units of the values, empty when unknown
    std::string units;
};

/** @brief
 * What a scan function is given about the file being scanned.
 */
struct MFDS_EXPORT mfds_scan_context
{
    mfds_scan_context() : coord(nullptr), prior(nullptr),
        format(nullptr), handle(nullptr) {}

    /// the path relative to the filegroup root, and the full path
    std::string filename;
    std::string path;

    /// the coordinate scanned
    const mfds_coordinate *coord;

    /// the text captured by each matcher of the coordinate
    std::vector<std::string> captures;

    /// the element values parsed from the captures, merged
    mfds_element_values elements;

    /// what the functions that ran before found in this file
    const mfds_scan_result *prior;

    /// the open file, set for in-file functions only
    mfds_file_format *format;
    const p_mfds_file_handle *handle;
};

/// a scan function, returns non-zero if the file could not be scanned
using mfds_scan_function = std::function<int(const mfds_scan_context &ctx,
    mfds_scan_result &res, mfds_diagnostics &diag)>;

/** @brief
 * A scan function and the elements of mfds_scan_result it sets.
 */
struct MFDS_EXPORT mfds_scan_function_info
{
    /// where the function looks
    enum
    {
        filename = 0,
        in_file = 1
    };

    /// the elements set, a bit mask
    enum
    {
        values = 0x1,
        in_idx = 0x2
    };

    mfds_scan_function_info() : kind(filename), elements(values) {}

    mfds_scan_function_info(const std::string &a_name, int a_kind,
        int a_elements, const mfds_scan_function &a_function) :
        name(a_name), kind(a_kind), elements(a_elements),
        function(a_function) {}

    std::string name;
    int kind;
    int elements;
    mfds_scan_function function;
};

/** @brief
 * The standard scan functions.
 *
 * @details
 *
 * | Name              | Kind     | Sets            | Description |
 * |-------------------|----------|-----------------|-------------|
 * | filename_date     | filename | values          | a date from the date elements, in the coordinate's time units |
 * | filename_value    | filename | values          | a number from a value or idx element |
 * | filename_index    | filename | in_idx          | an in-file index from an idx element |
 * | filename_text     | filename | values          | a name from a text or char element |
 * | in_file_values    | in_file  | values, in_idx  | the values and units of the coordinate variable |
 * | in_file_variables | in_file  | values, in_idx  | the data variables of the file |
 */
namespace mfds_scan_library
{
/// get a standard function by name. returns non-zero if it is not known
MFDS_EXPORT
int get(const std::string &name, mfds_scan_function_info &info);

/// the names of the standard functions
MFDS_EXPORT
std::vector<std::string> get_names();

MFDS_EXPORT
int scan_filename_date(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag);

MFDS_EXPORT
int scan_filename_value(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag);

MFDS_EXPORT
int scan_filename_index(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag);

MFDS_EXPORT
int scan_filename_text(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag);

/** reads the coordinate variable named after the coordinate, or after the
 * first of its alternate names found in the file.
 */
MFDS_EXPORT
int scan_in_file_values(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag);

MFDS_EXPORT
int scan_in_file_variables(const mfds_scan_context &ctx, mfds_scan_result &res,
    mfds_diagnostics &diag);
};

#endif

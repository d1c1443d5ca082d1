#ifndef mfds_coordinate_util_h
#define mfds_coordinate_util_h

/// @file

#include "mfds_config.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

/// For printing data as ASCII with the maximum supported numerical precision
#define max_prec(T) \
    std::setprecision(std::numeric_limits<T>::digits10 + 1)

/// Codes dealing with operations on coordinate values
namespace mfds_coordinate_util
{
/** @brief
 *  traits classes used to get default tolerances for comparing numbers
 *  of a given precision.
 *
 *  @details
 *  A relative tolerance is used for comparing large
 *  numbers and an absolute tolerance is used for comparing small numbers.
 */
template <typename n_t>
struct equal_tt {};

#define declare_equal_tt(cpp_t, atol, rtol)                                 \
/** Specialization for cpp_t with default absTol and relTol */              \
template <>                                                                 \
struct equal_tt<cpp_t>                                                      \
{                                                                           \
    static cpp_t absTol() { return atol; }                                  \
    static cpp_t relTol() { return rtol; }                                  \
};

declare_equal_tt(float, 10.0f*std::numeric_limits<float>::epsilon(),
    std::numeric_limits<float>::epsilon())

declare_equal_tt(double, 10.0*std::numeric_limits<double>::epsilon(),
    std::numeric_limits<float>::epsilon())

/** Compare two floating point numbers.  absTol handles comparing numbers very
 * close to zero.  relTol handles comparing larger values.
 */
template <typename T>
bool equal(T a, T b,
    T relTol = equal_tt<T>::relTol(), T absTol = equal_tt<T>::absTol(),
    typename std::enable_if<std::is_floating_point<T>::value>::type* = 0)
{
    // for numbers close to zero
    T diff = std::abs(a - b);
    if (diff <= absTol)
        return true;
    // realtive difference for larger values
    a = std::abs(a);
    b = std::abs(b);
    b = (b > a) ? b : a;
    b *= relTol;
    if (diff <= b)
        return true;
    return false;
}

/** Compare two coordinate values using the tolerance of the coordinate. The
 * tolerance is absolute.
 */
inline
bool equal_tol(double a, double b, double tol)
{
    return std::abs(a - b) <= tol;
}

/** Verify that the values are strictly increasing, ie. that consecutive
 * values differ by more than the tolerance. returns non-zero and the index
 * of the first offending value otherwise.
 */
MFDS_EXPORT
int check_strictly_increasing(const std::vector<double> &values,
    double tol, size_t &bad_id);

/** Locate a value in an ascending array. loc selects the index returned
 * when the value falls between two elements: 0 the closest, 1 the one
 * below, 2 the one above. Values within the tolerance of an element match
 * it exactly. returns non-zero if the value is outside the array and no
 * index satisfies loc.
 */
MFDS_EXPORT
int index_of(const std::vector<double> &values, double val, int loc,
    double tol, long &id);

/** Locate a value in an ascending array, exact match within the tolerance
 * only. returns non-zero if the value is not found.
 */
MFDS_EXPORT
int index_of(const std::vector<double> &values, double val, double tol,
    long &id);

/** The union of two ascending arrays. values within the tolerance are
 * merged, the value from a is kept.
 */
MFDS_EXPORT
std::vector<double> merge_union(const std::vector<double> &a,
    const std::vector<double> &b, double tol);

/// The intersection of two ascending arrays within the tolerance
MFDS_EXPORT
std::vector<double> merge_intersection(const std::vector<double> &a,
    const std::vector<double> &b, double tol);

/// returns true if the unit conversion library is available
MFDS_EXPORT
bool have_unit_conversion();

/** Convert values from one unit to another in place. Time units in the
 * standard calendar are converted directly, other units with UDUnits.
 * returns non-zero if a unit can not be parsed or the units are not
 * convertible.
 */
MFDS_EXPORT
int convert_units(const std::string &from, const std::string &to,
    std::vector<double> &values, std::string &errstr);
};

#endif

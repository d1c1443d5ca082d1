#ifndef mfds_app_util_h
#define mfds_app_util_h

/// @file

#include "mfds_config.h"

#include <string>
#include <vector>
#include <boost/program_options.hpp>

class mfds_keyring;
class mfds_coordinate_registry;

/// Codes shared among the command line applications
namespace mfds_app_util
{

/** Check for flag and if found print the help message
 * and the option definitions. return non-zero if the flag
 * was found.
 */
int process_command_line_help(int rank, const std::string &app_name,
    const std::string &flag,
    boost::program_options::options_description &opt_defs,
    boost::program_options::variables_map &opt_vals);

/** parses the command line options and checks for --help, --advanced_help, and
 * --full_help flags.  if any are found prints the associated option
 * defintions.  if any of the help flags were found 1 is returned. If there is
 * an error -1 is returned. Otherwise 0 is returned.
 */
int process_command_line_help(int rank, int argc, char **argv,
    boost::program_options::options_description &basic_opt_defs,
    boost::program_options::options_description &advanced_opt_defs,
    boost::program_options::options_description &all_opt_defs,
    boost::program_options::variables_map &opt_vals);

/** parse selections of the form dim=spec into a keyring. spec is an index
 * (time=3), a comma separated list (time=0,2,4), a slice with optional
 * bounds and step (time=0:10:2, lat=:5) or the same with names for string
 * coordinates (var=SSH, var=SSH,SST, var=SSH:SST). returns non-zero if a
 * selection can not be parsed.
 */
int parse_selection(const std::vector<std::string> &specs,
    const mfds_coordinate_registry &coords, mfds_keyring &keys);

}

#endif

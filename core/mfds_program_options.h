#ifndef mfds_program_options_h
#define mfds_program_options_h

/// @file

#if defined(MFDS_HAS_BOOST) && !defined(SWIG)
#include "mfds_config.h"
#include "mfds_common.h"

#include <iostream>

namespace boost
{
    namespace program_options
    {
        class options_description;
        class variables_map;
    }
};

using options_description = boost::program_options::options_description;
using variables_map = boost::program_options::variables_map;

/// declares the method that adds the class properties to an options description
#define MFDS_GET_PROPERTIES_DESCRIPTION()                                   \
                                                                            \
    /** Adds the class properties to the description object */              \
    void get_properties_description(const std::string &prefix,              \
        boost::program_options::options_description &opts);                 \

/// declares the method that initializes the class from a variables map
#define MFDS_SET_PROPERTIES()                                               \
    /** Sets the class properties from the map object */                    \
    void set_properties(const std::string &prefix,                          \
        boost::program_options::variables_map &opts);                       \

// helpers for implementation dealing with Boost program options. the above
// declarations are intended to be included in class header files, hence
// <string> and <boost/program_options.hpp> need to be included in the cxx
// files.
#define MFDS_POPTS_GET(_type, _prefix, _name, _desc)           \
     (((_prefix.empty()?"":_prefix+"::") + #_name).c_str(),    \
         boost::program_options::value<_type>()->default_value \
            (this->get_ ## _name()), "\n" _desc "\n")

#define MFDS_POPTS_SET(_opts, _type, _prefix, _name)             \
    {std::string opt_name =                                      \
        (_prefix.empty()?"":_prefix+"::") + #_name;              \
    bool defd = _opts[opt_name].defaulted();                     \
    if (!defd)                                                   \
    {                                                            \
        _type val = _opts[opt_name].as<_type>();                 \
        if (this->get_verbose())                                 \
        {                                                        \
            MFDS_STATUS("Setting " << opt_name << " = " << val)  \
        }                                                        \
        this->set_##_name(val);                                  \
    }}

#else
#define MFDS_GET_PROPERTIES_DESCRIPTION()
#define MFDS_SET_PROPERTIES()
#endif
#endif

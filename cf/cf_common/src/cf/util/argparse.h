#pragma once

#include "cf/version.h"

#include <exception>
#include <iostream>

#include <boost/program_options/option.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
namespace bpopt = boost::program_options;

//----------------------------------------------------------------------------
// both macros declare 'args' in the enclosing scope and 'return' from the enclosing
// function on '--help'/'--version' (0) or a command line error (1):

#define cf_ARGPARSE_STORE(parsed, opts) \
        bpopt::store (parsed, args); \
        if (args.count ("help")) \
        { \
            std::cout << std::endl << opts << std::endl; \
            return 0; \
        } \
        if (args.count ("version")) \
        { \
            std::cout << CF_BUILD_VERSION << std::endl; \
            return 0; \
        } \
        bpopt::notify (args); \
    /* */

#define cf_ARGPARSE_FAIL(opts) \
    catch (std::exception const & e) \
    { \
        std::cerr << std::endl << e.what () << "\n\n" << opts << std::endl; \
        return 1; \
    } \
    /* */

//............................................................................
/**
 * parses an op's own arguments ('av' excludes the op name)
 */
#define CF_ARGPARSE(av, opts, popts) \
    bpopt::variables_map args; \
    try \
    { \
        cf_ARGPARSE_STORE (bpopt::command_line_parser (av).options (opts).positional (popts).run (), opts) \
    } \
    cf_ARGPARSE_FAIL (opts) \
    /* */

/**
 * parses the tool's leading options, leaving the op name and everything after it in 'op_args'
 */
#define CF_OP_ARGPARSE(ac, av, opts, popts) \
    bpopt::variables_map args; \
    std::vector<std::string> op_args; \
    try \
    { \
        bpopt::parsed_options po { bpopt::command_line_parser (ac, av).options (opts).positional (popts).allow_unregistered ().run () }; \
        cf_ARGPARSE_STORE (po, opts) \
        op_args = bpopt::collect_unrecognized (po.options, bpopt::include_positional); \
        op_args.erase (op_args.begin ()); \
    } \
    cf_ARGPARSE_FAIL (opts) \
    /* */

//----------------------------------------------------------------------------


#include "cf/exceptions.h"

#include <cstring>
#include <iostream>
#include <sstream>

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
//............................................................................
namespace
{

#define cf_TAB  "  "

} // end of anonymous
//............................................................................
//............................................................................

app_exception::app_exception (CF_EXC_LOC_ARGS, string_literal_t const msg) :
    m_message { capture (file, line, func, (msg != nullptr ? std::string { msg } : std::string { })) }
{
}

app_exception::app_exception (CF_EXC_LOC_ARGS, std::string const & msg) :
    m_message { capture (file, line, func, msg) }
{
}
//............................................................................

string_literal_t
app_exception::what () const CF_NOEXCEPT
{
    return m_message->c_str ();
}
//............................................................................

std::shared_ptr<std::string const>
app_exception::capture (CF_EXC_LOC_ARGS, std::string const & msg)
{
    std::stringstream s { };
    s << '[' << file << ':' << line << "] " << func << "(): " << msg;

    return std::make_shared<std::string const> (s.str ());
}
//............................................................................

void
app_exception::print_visit (std::exception const & e, std::ostream & out, std::string const & prefix, int32_t const depth)
{
    std::string local_prefix { prefix };
    for (int32_t t = 0; t < depth; ++ t) local_prefix += cf_TAB;

    out << local_prefix;

    if (depth) out << CF_EXC_CAUSE;

    {
        string_literal_t e_msg = e.what ();
        if ((e_msg != nullptr) && e_msg [0]) out << e_msg;
    }

    out << "\r\n";

    try
    {
        std::rethrow_if_nested (e);
    }
    catch (std::exception const & cause)
    {
        print_visit (cause, out, prefix, depth + 1);
    }
}
//............................................................................
//............................................................................

exc_info::exc_info (std::exception const & e, std::string const & indent) CF_NOEXCEPT :
    m_e { e },
    m_indent { indent }
{
}

std::ostream &
operator<< (std::ostream & os, exc_info const & obj) CF_NOEXCEPT
{
    try
    {
        os << "\r\n";
        print_exception (obj.m_e, os, obj.m_indent);
    }
    catch (std::exception const & e)
    {
        std::cerr << "failed to print exception: " << e.what () << std::endl;
    }

    return os;
}

} // end of namespace
//----------------------------------------------------------------------------

#pragma once

#include "cf/macros.h" // CF_FILENAME
#include "cf/util/impl/constexpr_strings.h" // util::impl::path_stem() used by CF_FILENAME

#include <exception>
#include <memory>

//----------------------------------------------------------------------------
/*
 * exception throwing/chaining:
 */
#define throw_x(cls, msg, /* extra args */...)  throw cls { CF_FILENAME, __LINE__, __func__, (msg), __VA_ARGS__ }
#define chain_x(cls, msg, /* extra args */...)  std::throw_with_nested (cls { CF_FILENAME, __LINE__, __func__, (msg), __VA_ARGS__ })


#define CF_EXC_LOC_ARGS     string_literal_t const file, int32_t const line, string_literal_t const func
#define CF_EXC_CAUSE        "CAUSE: "

//----------------------------------------------------------------------------
namespace cf
{
//............................................................................
/**
 * equivalent to
 * @code
 *     app_exception::print (e, out, indent);
 * @endcode
 */
inline void
print_exception (std::exception const & e, std::ostream & out, std::string const & indent = { });

//............................................................................
/**
 * root of the exception type hierarchy
 *
 * the message is captured as "[file:line] func(): msg"
 */
class app_exception: public std::exception // copyable (not merely movable) for std::throw_with_nested()
{
    public: // ...............................................................

        explicit app_exception (CF_EXC_LOC_ARGS, string_literal_t const msg);
        explicit app_exception (CF_EXC_LOC_ARGS, std::string const & msg);

        // std::exception:

        string_literal_t what () const CF_NOEXCEPT override;

        // custom extensions:

        /**
         * @note this will traverse the chain of nested exceptions starting with 'e', if any
         */
        static void print (std::exception const & e, std::ostream & out, std::string const & indent = { })
        {
            print_visit (e, out, indent, 0);
        }

    private: // ..............................................................

        static CF_ASSUME_COLD std::shared_ptr<std::string const> capture (CF_EXC_LOC_ARGS, std::string const & msg);

        static CF_ASSUME_COLD void print_visit (std::exception const & e, std::ostream & out, std::string const & prefix, int32_t const depth);

        std::shared_ptr<std::string const> m_message; // shared to keep copies cheap and 'noexcept'

}; // end of class
//............................................................................

#define CF_DEFINE_EXCEPTION(cls, base) \
    class cls : public base \
    { \
        using super     = base; \
        \
        public: \
        \
            using super::super; /* inherit constructors */ \
        \
    } \
    /* */

    CF_DEFINE_EXCEPTION (illegal_state, app_exception);
    CF_DEFINE_EXCEPTION (invalid_input, app_exception);
    CF_DEFINE_EXCEPTION (io_exception,  app_exception);

    CF_DEFINE_EXCEPTION (check_failure,     invalid_input);
    CF_DEFINE_EXCEPTION (out_of_bounds,     invalid_input);
    CF_DEFINE_EXCEPTION (type_mismatch,     invalid_input);
    CF_DEFINE_EXCEPTION (parse_failure,     invalid_input);

//............................................................................
/**
 * manipulator-like wrapper for exceptions:
 *
 * @code
 *  LOG_error << exc_info (e);
 * @endcode
 */
class exc_info final: noncopyable
{
    public: // ...............................................................

        exc_info (std::exception const & e, std::string const & indent = { }) CF_NOEXCEPT;

        friend std::ostream & operator<< (std::ostream & os, exc_info const & obj) CF_NOEXCEPT;

    private: // ..............................................................

        std::exception const & m_e; // note: stored by ref
        std::string const m_indent;

}; // end of class
//............................................................................

inline void
print_exception (std::exception const & e, std::ostream & out, std::string const & indent)
{
    app_exception::print (e, out, indent);
}

} // end of namespace
//----------------------------------------------------------------------------

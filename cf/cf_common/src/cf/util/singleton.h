#pragma once

#include "cf/types.h"

#include <memory>

//----------------------------------------------------------------------------
namespace cf
{
namespace util
{
/**
 * default factory: constructs 'T' with its default constructor
 */
template<typename T>
struct default_factory
{
    static T * create ()
    {
        return new T { };
    }

}; // end of class
//............................................................................
/**
 * @note 'T_FACTORY::create()' is invoked once, on first 'instance()' call; the instance
 *       is destroyed at static destruction time
 */
template<typename T, typename T_FACTORY = default_factory<T> >
class singleton final: noncopyable
{
    public: // ...............................................................

        /*
         * note: this simple impl is MT-safe in c++11
         */
        static T & instance ()
        {
            static std::unique_ptr<T> const g_obj { T_FACTORY::create () };

            return (* g_obj);
        }

}; // end of class

} // end of 'util'
} // end of namespace
//----------------------------------------------------------------------------

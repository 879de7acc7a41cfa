
#include "cf/io/files.h"

#include "cf/asserts.h"
#include "cf/strings.h"
#include "cf/util/json.h"

#include <boost/filesystem/fstream.hpp>

//----------------------------------------------------------------------------
namespace cf
{
namespace io
{
//............................................................................

#define cf_UNIQUE_PREFIX    CF_APP_NAME ".%%%%-%%%%-%%%%-%%%%"

//............................................................................

fs::path
absolute_path (fs::path const & path, fs::path const & base)
{
    return fs::absolute (path, (base.empty () ? fs::current_path () : base));
}
//............................................................................

json
read_json (fs::path const & file)
{
    fs::ifstream in { file };
    if (! in)
        throw_x (io_exception, "failed to open " + print (absolute_path (file)) + " for reading");

    try
    {
        return json::parse (in);
    }
    catch (std::exception const & e)
    {
        chain_x (parse_failure, "failed to parse " + print (absolute_path (file)) + " as JSON");
    }

    CF_ASSUME_UNREACHABLE (file);
}

void
write_json (json const & j, fs::path const & file)
{
    fs::ofstream out { file, std::ios::out | std::ios::trunc };
    if (! out)
        throw_x (io_exception, "failed to open " + print (absolute_path (file)) + " for writing");

    out << j.dump (4) << std::endl;

    if (! out)
        throw_x (io_exception, "failed to write " + print (absolute_path (file)));
}
//............................................................................

fs::path
temp_dir ()
{
    return fs::temp_directory_path ();
}

fs::path
unique_path (fs::path const & parent, std::string const & name_suffix)
{
    return fs::unique_path (parent / join_as_name (cf_UNIQUE_PREFIX, name_suffix));
}
//............................................................................

bool
create_dirs (fs::path const & dir)
{
    check_condition (! dir.empty ());

    fs::file_status const s { fs::status (dir) };

    if (fs::exists (s))
    {
        if (fs::is_directory (s))
            return false; // nothing to do

        throw_x (io_exception, "path " + print (absolute_path (dir)) + " exists but is not a directory");
    }

    try
    {
        return fs::create_directories (dir);
    }
    catch (std::exception const & e)
    {
        chain_x (io_exception, "create_dirs(" + print (absolute_path (dir)) + ") failed");
    }

    CF_ASSUME_UNREACHABLE (dir);
}

void
clean_dir (fs::path const & dir, bool const remove)
{
    check_condition (! dir.empty ());

    fs::file_status const s { fs::status (dir) };

    if (! fs::exists (s))
        return;

    if (! fs::is_directory (s))
        throw_x (io_exception, "path " + print (absolute_path (dir)) + " exists but is not a directory");

    try
    {
        if (remove)
            fs::remove_all (dir);
        else
        {
            for (fs::directory_entry const & de : fs::directory_iterator { dir })
            {
                fs::remove_all (de.path ()); // note: this handles symlinks as expected (links deleted, not their targets)
            }
        }
    }
    catch (std::exception const & e)
    {
        chain_x (io_exception, "clean_dir(" + print (absolute_path (dir)) + ") failed");
    }
}

} // end of 'io'
} // end of namespace
//----------------------------------------------------------------------------

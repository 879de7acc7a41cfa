#pragma once

#include "cf/filesystem.h"
#include "cf/util/json_fwd.h"

//----------------------------------------------------------------------------
namespace cf
{
namespace io
{
//............................................................................

extern fs::path
absolute_path (fs::path const & path, fs::path const & base = { });

//............................................................................
/**
 * @throws io_exception if 'file' can't be opened, parse_failure if its content is not valid JSON
 */
extern json
read_json (fs::path const & file);

/**
 * overwrites 'file' (if it exists)
 */
extern void
write_json (json const & j, fs::path const & file);

//............................................................................

extern fs::path
temp_dir ();

extern fs::path
unique_path (fs::path const & parent, std::string const & name_suffix = { });

//............................................................................
/**
 * @return 'true' if 'dir' was created
 */
extern bool
create_dirs (fs::path const & dir);

/**
 * delete contents of 'dir' (and 'dir' itself if 'remove' is 'true')
 */
extern void
clean_dir (fs::path const & dir, bool const remove = false);

} // end of 'io'
} // end of namespace
//----------------------------------------------------------------------------

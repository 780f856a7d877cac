/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#include <tradesafe/utilities/tempdir.hpp>

#include <cstdlib>

namespace tradesafe { namespace utilities {

fc::path
temp_directory_path() {
    auto dir = fc::path();
    if(auto env = getenv("TRADESAFE_TEMPDIR"); env != nullptr) {
        dir = fc::path(env);
    }
    else {
        dir = fc::temp_directory_path() / "tradesafe-tmp";
    }

    if(!fc::exists(dir)) {
        fc::create_directories(dir);
    }
    return dir;
}

}}  // namespace tradesafe::utilities

#include "asset_provider.hpp"
#include "minefield_config.h"

std::string get_asset_path(const std::string &file_name)
{
        std::string assets_dir(MINEFIELD_ASSETS_DIR);
        return assets_dir + "/" + file_name;
}

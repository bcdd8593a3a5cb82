#pragma once
#include "montager/core/Config.hpp"
#include "montager/core/Raster.hpp"

#include <string>

/*
  Helpers shared by the CLI modes: building the processing config from
  flags, and viewing or saving composed rasters.
*/

/* Build a ProcessingConfig from the shared flags:
     --size=WxH --intensity= --randomness= --clip= --padding= --stride=
     --columns=A,B,C --font= --rowfont= --colfont= --nolabels
   Missing flags keep the ProcessingConfig defaults. */
montager::ProcessingConfig config_from_args(int argc, char** argv);

/* One-line summary of a config for the log. */
std::string describe(const montager::ProcessingConfig& cfg);

/* Save a raster as PNG to 'path'.
   Prints a short message on success or failure; returns false on failure. */
bool save_raster_png(const montager::Raster& r, const std::string& path);

/* Show a raster in a window and wait for a key press. */
void show_raster(const montager::Raster& r, const std::string& title);

#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Compose a single row from one channel pair.
   Example:
     montager-cli compose --ch1=gfp.tif --ch2=rfp.tif --label=WT --first --save=row.png */
int run_compose(int argc, char** argv);

/* Compose several rows (in parallel) and stack them into one montage.
   Example:
     montager-cli montage --pairs=a1.tif,b1.tif,a2.tif,b2.tif --labels=WT,KO --save=montage.png */
int run_montage(int argc, char** argv);

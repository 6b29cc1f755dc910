#pragma once

/*here you can change the compile-time defaults, ~/.h5forestrc overrides them at runtime*/

#define H5F_VERSION "0.1.0"
#define H5F_RC_NAME ".h5forestrc"

#ifndef H5F_VALUES_CAP
#define H5F_VALUES_CAP 1000
#endif

#ifndef H5F_POLL_MS
#define H5F_POLL_MS 20
#endif

#ifndef H5F_HIST_BINS
#define H5F_HIST_BINS 50
#endif

/* elements read per chunk when computing statistics or fetching plot data */
#ifndef H5F_CHUNK_ELEMENTS
#define H5F_CHUNK_ELEMENTS (1 << 20)
#endif

#ifndef H5F_JUMP_STEP
#define H5F_JUMP_STEP 10
#endif

#define H5F_METADATA_HEIGHT 10
#define H5F_PLOT_HEIGHT 14
#define H5F_BAR_HEIGHT 3

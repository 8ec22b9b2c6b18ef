#pragma once

/*compile-time knobs of the interpreter and the terminal host*/

// nested @x playback deeper than this is aborted
#ifndef VK_MACRO_MAX_DEPTH
#define VK_MACRO_MAX_DEPTH 16
#endif

#ifndef VK_JUMPLIST_MAX
#define VK_JUMPLIST_MAX 100
#endif

#define VK_DEFAULT_REGISTER '"'

#define VK_RC_FILE ".vimkeysrc"

#ifndef VK_WRITE_CHUNK_SIZE
#define VK_WRITE_CHUNK_SIZE (1 << 16)
#endif

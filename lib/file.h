#ifndef FILE_H
#define FILE_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Reads a whole text file; returns a malloc'ed, NUL-terminated buffer or NULL.
// out_len (optional) receives the byte length.
char* read_text_file(const char *filename, size_t *out_len);

// Writes content through a temporary sibling file that is renamed over
// filename once fully flushed. Returns 0 on success or the errno of the
// failing step; on failure filename is left untouched and no temporary
// file remains.
int write_text_file_atomic(const char *filename, const char *content, size_t len);

bool file_exists(const char *filename);

// True when both paths name the same existing inode
bool same_file(const char *a, const char *b);

#ifdef __cplusplus
}
#endif

#endif // FILE_H

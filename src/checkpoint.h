#ifndef CHECKPOINT_H
#define CHECKPOINT_H

#include "jobtypes.h"

#include <vector>

namespace orca
{

/**
 * One line of the checkpoint file: space separated key=value tokens with URL-escaped values.
 */
ORCA_API mstring FormatJobRecord(const tJobRecord& rec);
ORCA_API bool ParseJobRecord(string_view line, tJobRecord& ret);

/**
 * Write the records as gzip-compressed text, replacing the old file atomically.
 */
ORCA_API bool SaveCheckpoint(cmstring& path, const std::vector<tJobRecord>& records, mstring& sErr);

/**
 * Read the records. A missing file is not an error, malformed lines are skipped with
 * a log message.
 */
ORCA_API bool LoadCheckpoint(cmstring& path, std::vector<tJobRecord>& ret, mstring& sErr);

}

#endif // CHECKPOINT_H

#ifndef OCUTILPATH_H_
#define OCUTILPATH_H_

#include "octypes.h"

namespace orca
{

string_view GetBaseName(string_view in);
// directory part without trailing slash, "." if there is none
mstring GetDirPart(string_view in);
// file name extension without the dot, lower-cased, empty if none
mstring GetExtension(string_view path);
std::string PathCombine(string_view a, string_view b);
bool IsAbsolute(string_view path);

}

#endif

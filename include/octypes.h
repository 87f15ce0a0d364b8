#ifndef OCTYPES_H_
#define OCTYPES_H_

#include "config.h"

#include <string>
#include <string_view>
#include <limits>
#include <cstdint>

#include <sys/types.h>

namespace orca
{

using mstring = std::string;
using cmstring = const std::string;
using LPCSTR = const char*;
using std::string_view;
using namespace std::literals::string_view_literals;
using namespace std::literals::string_literals;

typedef mstring::size_type tStrPos;
static constexpr tStrPos stmiss = cmstring::npos;

}

#define MAX_VAL(x) std::numeric_limits< x >::max()
#define MIN_VAL(x) std::numeric_limits< x >::min()

#define WARN_UNUSED __attribute__ ((warn_unused_result))
#define __just_fall_through [[fallthrough]]

#ifndef _countof
#define _countof(x) (sizeof(x)/sizeof(x[0]))
#endif

#endif // OCTYPES_H_

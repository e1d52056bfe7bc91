#include "test_helpers.hpp"
#include <FormFusion/time.hpp>

using FormFusion::kTimeFormats;
using FormFusion::time_detail::MatchesLayout;

static_assert(MatchesLayout(kTimeFormats[0], "2022-02-22T12:00:00Z"));
static_assert(MatchesLayout(kTimeFormats[0], "2022-02-22T12:00:00.123456789+09:00"));
static_assert(MatchesLayout(kTimeFormats[2], "2022-02-22T12:30"));
static_assert(MatchesLayout(kTimeFormats[2], "2022-02-22T9:30"));
static_assert(MatchesLayout(kTimeFormats[4], "2022-02-22 12:30:15"));
static_assert(MatchesLayout(kTimeFormats[5], "2022-02-22"));
static_assert(MatchesLayout(kTimeFormats[6], "15:04:05"));

// Field widths
static_assert(!MatchesLayout(kTimeFormats[5], "2022-2-2"));
static_assert(!MatchesLayout(kTimeFormats[5], "22022-02-22"));
static_assert(!MatchesLayout(kTimeFormats[6], "15:4:05"));

// Surrounding text
static_assert(!MatchesLayout(kTimeFormats[5], " 2022-02-22"));
static_assert(!MatchesLayout(kTimeFormats[5], "2022-02-22 "));
static_assert(!MatchesLayout(kTimeFormats[5], "infinite-future"));

// Offsets and fractions
static_assert(!MatchesLayout(kTimeFormats[0], "2022-02-22T12:00:00"));
static_assert(!MatchesLayout(kTimeFormats[0], "2022-02-22T12:00:00+0900"));
static_assert(!MatchesLayout(kTimeFormats[0], "2022-02-22T12:00:00.Z"));
static_assert(!MatchesLayout(kTimeFormats[2], "2022-02-22T12:30:15"));

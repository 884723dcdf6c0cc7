#pragma once

namespace exitc
{
inline constexpr int ok       = 0;
inline constexpr int failure  = 1;
inline constexpr int bad_args = 2;
inline constexpr int io_error = 3;
inline constexpr int pipeline = 4;  // send/open failed in the pipeline
inline constexpr int pending  = 5;  // message still missing fragments
}  // namespace exitc

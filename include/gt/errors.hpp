#pragma once

// Error codes generated from errors.def.
// Define ERR(name, val, msg) before including this file if you want to extract text or
// mapping.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "gt/errors.def"
};

#undef ERR

// Shorthand for returning an Err as gt_err
#define GT_ERR(name) static_cast<gt_err>(Err::name)

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "gt/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

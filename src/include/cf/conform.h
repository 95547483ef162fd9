// Public header for the conform library
#pragma once

#include <cf/value.h>
#include <cf/result.h>
#include <cf/failure_path.h>
#include <cf/parse.h>

#ifndef ERRORKIT_ERRORKIT_HPP
#define ERRORKIT_ERRORKIT_HPP

#include "errorkit/error.hpp"
#include "errorkit/fault.hpp"
#include "errorkit/logging.hpp"
#include "errorkit/options.hpp"
#include "errorkit/safe_exec.hpp"
#include "errorkit/validate.hpp"

#endif // ERRORKIT_ERRORKIT_HPP

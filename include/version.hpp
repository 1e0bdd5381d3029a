/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#define RIOCON_VERSION_MAJOR 1
#define RIOCON_VERSION_MINOR 0

#define STRING_IMPL(x) #x
#define STRING(x) STRING_IMPL(x)

#define RIOCON_VERSION_STRING STRING(RIOCON_VERSION_MAJOR) "." STRING(RIOCON_VERSION_MINOR)

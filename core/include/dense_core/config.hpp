#pragma once

#ifndef DENSE_CORE_ENABLE_LEAST_SQUARES
#define DENSE_CORE_ENABLE_LEAST_SQUARES 1
#endif

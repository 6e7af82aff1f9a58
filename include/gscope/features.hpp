// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

//--------------------------------------------------------------------------------------------------

#define GSCOPE_FEATURE(X) (GSCOPE_PRIVATE_FEATURE_ ## X())

#ifndef NDEBUG
    #define GSCOPE_PRIVATE_FEATURE_DEBUG() 1
    #define GSCOPE_PRIVATE_FEATURE_RELEASE() 0
#else
    #define GSCOPE_PRIVATE_FEATURE_DEBUG() 0
    #define GSCOPE_PRIVATE_FEATURE_RELEASE() 1
#endif // !defined(NDEBUG)

#if defined(TRACY_ENABLE)
    #define GSCOPE_PRIVATE_FEATURE_TRACY() 1
#else
    #define GSCOPE_PRIVATE_FEATURE_TRACY() 0
#endif

// Target memory is always decoded as little-endian. On a big-endian host the raw bytes must be
// swapped after they are copied out of the buffer.
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    #define GSCOPE_PRIVATE_FEATURE_LITTLE_ENDIAN_HOST() 0
#else
    #define GSCOPE_PRIVATE_FEATURE_LITTLE_ENDIAN_HOST() 1
#endif

//--------------------------------------------------------------------------------------------------

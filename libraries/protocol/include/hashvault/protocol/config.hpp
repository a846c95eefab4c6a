/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#define HASHVAULT_SYMBOL         "HVT"
#define HASHVAULT_ADDRESS_PREFIX "HV"

#define HASHVAULT_100_PERCENT                   10000
#define HASHVAULT_1_PERCENT                     (HASHVAULT_100_PERCENT/100)

/** fee rate applied at genesis when none is configured */
#define HASHVAULT_DEFAULT_FEE_RATE_BPS          30
/** upper bound accepted by fee rate updates, 10% */
#define HASHVAULT_MAX_FEE_RATE_BPS              (10 * HASHVAULT_1_PERCENT)

/** bounds on timelock - head_block_num at order creation, in blocks */
#define HASHVAULT_DEFAULT_MIN_TIMELOCK          100
#define HASHVAULT_DEFAULT_MAX_TIMELOCK          14400

/** dest_amount_per_unit is a fixed point rate with this scale */
#define HASHVAULT_RATE_PRECISION                uint64_t( 1000000000000ull )

#define HASHVAULT_PREIMAGE_SIZE                 32

#define HASHVAULT_MAX_SHARE_SUPPLY              int64_t(1000000000000000000ll)

#define HASHVAULT_DEFAULT_BLOCK_INTERVAL        6 /* seconds */

#define HASHVAULT_MAX_NESTED_OBJECTS            (200)

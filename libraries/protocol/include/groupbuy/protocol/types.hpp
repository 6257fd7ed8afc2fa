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
#include <groupbuy/db/object_id.hpp>
#include <groupbuy/protocol/config.hpp>

#include <fc/container/flat_fwd.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>
#include <fc/uint128.hpp>
#include <fc/variant_object.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/tuple/elem.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#define GROUPBUY_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define GROUPBUY_NAME_TO_ID_TYPE(x, y, name) BOOST_PP_CAT(name, _id_type)
#define GROUPBUY_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            GROUPBUY_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;
#define GROUPBUY_REFLECT_ID(x, id_namespace, name) FC_REFLECT_TYPENAME(groupbuy::id_namespace::name)

#define GROUPBUY_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace groupbuy { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(GROUPBUY_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(GROUPBUY_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(groupbuy::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(GROUPBUY_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   BOOST_PP_SEQ_FOR_EACH(GROUPBUY_REFLECT_ID, id_namespace, BOOST_PP_SEQ_TRANSFORM(GROUPBUY_NAME_TO_ID_TYPE, , names_seq))

namespace groupbuy { namespace protocol {
using namespace groupbuy::db;

using std::map;
using std::vector;
using std::string;
using std::deque;
using std::shared_ptr;
using std::unique_ptr;
using std::pair;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::time_point_sec;
using fc::safe;
using fc::static_variant;

/// Amounts and unit counts; arithmetic overflow throws instead of wrapping
using share_type = safe<int64_t>;
/// Percentages in units of 1/GROUPBUY_100_PERCENT
using basis_points_type = uint16_t;

enum reserved_spaces {
   relative_protocol_ids = 0,
   protocol_ids          = 1,
   implementation_ids    = 2
};

struct void_result{};

} }  // groupbuy::protocol

/// Object types in the Protocol Space (enum object_type (1.x.x))
GROUPBUY_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                    /* 1.0.x  */ (null) // no data
                    /* 1.1.x  */ (base) // no data
                    /* 1.2.x  */ (account)
                    /* 1.3.x  */ (asset)
                    /* 1.4.x  */ (group_order)
                    /* 1.5.x  */ (contribution)
                    /* 1.6.x  */ (reward_record)
                    /* 1.7.x  */ (reward_pool)
                   )

FC_REFLECT_TYPENAME(groupbuy::protocol::share_type)
FC_REFLECT(groupbuy::protocol::void_result,)
FC_REFLECT_ENUM(groupbuy::protocol::reserved_spaces, (relative_protocol_ids)(protocol_ids)(implementation_ids))

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
#include <groupbuy/chain/replay.hpp>
#include <groupbuy/chain/database.hpp>

namespace groupbuy { namespace chain {

replay_report replay( database& db, const vector<replay_step>& steps )
{
   replay_report report;
   for( uint32_t i = 0; i < steps.size(); ++i )
   {
      const auto& step = steps[i];
      if( step.advance_seconds > 0 )
         db.advance_time( step.advance_seconds );
      try
      {
         db.push_operation( step.op );
         ++report.applied;
      }
      catch( const fc::exception& e )
      {
         wlog( "Replay step ${i} was rejected: ${e}", ("i",i)("e",e.to_detail_string()) );
         report.rejected_steps.push_back( i );
      }
   }
   return report;
}

} } // groupbuy::chain

#include <boost/chrono/ceil.hpp>
#include "deadline.h"

namespace procsup
{

deadline::deadline( double seconds ): at_( clock_type::now() )
{
  if( !( seconds > 0 ) )
    return;
  // saturate at the end of the clock rather than overflow the tick count;
  // one second of slack absorbs the double rounding near the limit
  double room = boost::chrono::duration<double>( clock_type::time_point::max() - at_ ).count();
  if( seconds >= room - 1 )
  {
    at_ = clock_type::time_point::max();
    return;
  }
  at_ += boost::chrono::duration_cast<clock_type::duration>(
           boost::chrono::duration<double>( seconds ) );
}
bool deadline::expired() const
{
  return clock_type::now() >= at_;
}
boost::chrono::milliseconds deadline::remaining() const
{
  clock_type::time_point now = clock_type::now();
  if( now >= at_ )
    return boost::chrono::milliseconds( 0 );
  // round up so a caller sleeping for remaining() does not wake just short
  return boost::chrono::ceil<boost::chrono::milliseconds>( at_ - now );
}
double deadline::remaining_seconds() const
{
  clock_type::time_point now = clock_type::now();
  if( now >= at_ )
    return 0;
  return boost::chrono::duration<double>( at_ - now ).count();
}

}

// vim: ts=2:et
#include <cstdlib>
#include <cmath>
#include <sstream>
#include "kill_sequence.h"

namespace procsup
{
namespace
{

bool parse_action( const std::string& token, kill_action& action )
{
  if( token == "graceful" || token == "TERM" || token == "SIGTERM" )
  {
    action = ka_graceful;
    return true;
  }
  if( token == "forceful" || token == "KILL" || token == "SIGKILL" )
  {
    action = ka_forceful;
    return true;
  }
  return false;
}

bool parse_seconds( const std::string& token, double& seconds )
{
  if( token.empty() )
    return false;
  char* end = NULL;
  double value = strtod( token.c_str(), &end );
  if( end == NULL || *end != '\0' || value != value || value == HUGE_VAL )
    return false;
  seconds = value;
  return true;
}

bool fail( std::string* error, const std::string& reason )
{
  if( error != NULL )
    *error = reason;
  return false;
}

}
///////////////////////////////////////////////////////////////////////////////
const char* kill_action_name( kill_action action )
{
  return action == ka_forceful ? "forceful" : "graceful";
}
///////////////////////////////////////////////////////////////////////////////
kill_sequence::kill_sequence()
{
}
kill_sequence::~kill_sequence()
{
}
kill_sequence kill_sequence::default_sequence()
{
  kill_sequence seq;
  seq.step( ka_graceful, 2 ).step( ka_graceful, 8 ).step( ka_forceful, 3 ).step( ka_forceful, 7 );
  return seq;
}
bool kill_sequence::parse( const std::vector<std::string>& tokens, kill_sequence& out,
                           std::string* error )
{
  if( tokens.empty() )
    return fail( error, "empty kill sequence" );

  kill_sequence seq;
  std::size_t i = 0;
  while( i < tokens.size() )
  {
    kill_action action;
    if( !parse_action( tokens[i], action ) )
      return fail( error, "unknown termination action '" + tokens[i] + "'" );
    ++i;
    if( i == tokens.size() )
    {
      seq.step( action, 0 );
      break;
    }
    double grace = 0;
    if( !parse_seconds( tokens[i], grace ) )
    {
      kill_action next;
      if( parse_action( tokens[i], next ) )
        return fail( error, std::string( "grace period missing after '" ) + tokens[i - 1] + "'" );
      return fail( error, "malformed grace period '" + tokens[i] + "'" );
    }
    if( grace < 0 )
      return fail( error, "negative grace period '" + tokens[i] + "'" );
    seq.step( action, grace );
    ++i;
  }
  out = seq;
  return true;
}
bool kill_sequence::parse( const std::string& text, kill_sequence& out, std::string* error )
{
  std::vector<std::string> tokens;
  std::stringstream is( text );
  std::string token;
  while( is >> token )
  {
    tokens.push_back( token );
  }
  return parse( tokens, out, error );
}
kill_sequence& kill_sequence::step( kill_action action, double grace_seconds )
{
  steps_.push_back( kill_step( action, grace_seconds ) );
  return *this;
}
kill_sequence::StepIterator kill_sequence::begin() const
{
  return steps_.begin();
}
kill_sequence::StepIterator kill_sequence::end() const
{
  return steps_.end();
}
double kill_sequence::total_grace_seconds() const
{
  double total = 0;
  for( StepIterator iter = steps_.begin(); iter != steps_.end(); ++iter )
  {
    total += iter->grace_seconds;
  }
  return total;
}
std::string kill_sequence::str() const
{
  std::stringstream out;
  for( StepIterator iter = steps_.begin(); iter != steps_.end(); ++iter )
  {
    if( iter != steps_.begin() )
      out << " ";
    out << kill_action_name( iter->action ) << " " << iter->grace_seconds;
  }
  return out.str();
}
bool kill_sequence::operator==( const kill_sequence& rhs ) const
{
  if( steps_.size() != rhs.steps_.size() )
    return false;
  for( std::size_t i = 0; i < steps_.size(); ++i )
  {
    if( steps_[i].action != rhs.steps_[i].action
        || steps_[i].grace_seconds != rhs.steps_[i].grace_seconds )
      return false;
  }
  return true;
}
///////////////////////////////////////////////////////////////////////////////
}

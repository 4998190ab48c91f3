#include <vector>
#include "procsup/logger_imp.h"
#include "kill_registry.h"

namespace procsup
{
///////////////////////////////////////////////////////////////////////////////
kill_registry::kill_registry()
{
}
kill_registry::~kill_registry()
{
}
void kill_registry::add( const child_ptr& c )
{
  if( !c )
    return;
  lock_type lock( mutex_ );
  children_[c.get()] = c;
}
void kill_registry::remove( const child* c )
{
  lock_type lock( mutex_ );
  children_.erase( c );
}
std::size_t kill_registry::size() const
{
  lock_type lock( mutex_ );
  return children_.size();
}
std::size_t kill_registry::drain()
{
  std::vector<boost::weak_ptr<child> > pending;
  {
    // released before terminating: a child destroyed below removes itself
    lock_type lock( mutex_ );
    for( child_map_type::iterator i = children_.begin(); i != children_.end(); ++i )
    {
      pending.push_back( i->second );
    }
    children_.clear();
  }
  std::size_t terminated = 0;
  for( std::size_t i = 0; i < pending.size(); ++i )
  {
    child_ptr c = pending[i].lock();
    if( !c || !c->alive() )
      continue;
    LOG( INFO, "terminating pid " << c->get_pid() << " on shutdown" );
    if( c->terminate() )
      ++terminated;
    else
      LOG( ERROR, "pid " << c->get_pid() << " survived the kill sequence" );
  }
  return terminated;
}
///////////////////////////////////////////////////////////////////////////////
shutdown_hook::shutdown_hook()
{
}
shutdown_hook::~shutdown_hook()
{
  try
  {
    std::size_t n = kill_registry_inst::get()->drain();
    if( n > 0 )
      LOG( NOTICE, "shutdown terminated " << n << " child process(es)" );
  }
  catch( const std::exception& e )
  {
    LOG( ERROR, "shutdown drain failed: " << e.what() );
  }
}
///////////////////////////////////////////////////////////////////////////////
}

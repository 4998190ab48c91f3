#ifndef _PROCSUP_KILL_SEQUENCE_H_
#define _PROCSUP_KILL_SEQUENCE_H_

#include <string>
#include <vector>

namespace procsup
{

enum kill_action { ka_graceful = 0, ka_forceful };

const char* kill_action_name( kill_action action );

struct kill_step
{
  kill_step( kill_action a, double grace ): action( a ), grace_seconds( grace )
  {}
  kill_action action;
  // blocking reap bound after the action, 0 means no wait
  double grace_seconds;
};

///////////////////////////////////////////////////////////////////////////////
/*!
 \brief - ordered (action, grace period) pairs driven by child::terminate
 */
class kill_sequence
{
 public:
  typedef std::vector<kill_step> StepVector;
  typedef StepVector::const_iterator StepIterator;

  kill_sequence();
  ~kill_sequence();
  /*!
   \brief - graceful 2s, graceful 8s, forceful 3s, forceful 7s
   */
  static kill_sequence default_sequence();
  /*!
   \brief - parse the flat list form, e.g. "TERM 2 TERM 8 KILL 3 KILL 7"
            actions: graceful|TERM|SIGTERM, forceful|KILL|SIGKILL
            the grace period may be omitted on the final entry only
   \param error - receives the reason on failure, may be NULL
   */
  static bool parse( const std::vector<std::string>& tokens, kill_sequence& out,
                     std::string* error );
  static bool parse( const std::string& text, kill_sequence& out, std::string* error );

  kill_sequence& step( kill_action action, double grace_seconds = 0 );
  StepIterator begin() const;
  StepIterator end() const;
  std::size_t size() const
  {
    return steps_.size();
  }
  bool empty() const
  {
    return steps_.empty();
  }
  double total_grace_seconds() const;
  std::string str() const;
  bool operator==( const kill_sequence& rhs ) const;
 private:
  StepVector steps_;
};

}

#endif // _PROCSUP_KILL_SEQUENCE_H_

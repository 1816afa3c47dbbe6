#include <grab/transfer/transfer-scope.hxx>

#include <grab/download/download-error.hxx>

using namespace std;

namespace grab
{
  cancel_scope::
  cancel_scope ()
      : state_ (make_shared<state> ())
  {
  }

  cancel_scope cancel_scope::
  with_cancel (const cancel_scope& p)
  {
    auto s (make_shared<state> ());
    s->parents.push_back (p.state_);
    return cancel_scope (move (s));
  }

  cancel_scope cancel_scope::
  with_deadline (const cancel_scope& p, time_point t)
  {
    auto s (make_shared<state> ());
    s->deadline = t;
    s->parents.push_back (p.state_);
    return cancel_scope (move (s));
  }

  cancel_scope cancel_scope::
  with_timeout (const cancel_scope& p, clock::duration d)
  {
    return with_deadline (p, clock::now () + d);
  }

  cancel_scope cancel_scope::
  linked (const cancel_scope& x, const cancel_scope& y)
  {
    auto s (make_shared<state> ());
    s->parents.push_back (x.state_);

    if (y.state_ != x.state_)
      s->parents.push_back (y.state_);

    return cancel_scope (move (s));
  }

  void cancel_scope::
  cancel () const noexcept
  {
    state_->canceled.store (true, memory_order_release);
  }

  boost::system::error_code cancel_scope::
  error () const noexcept
  {
    return error (*state_);
  }

  boost::system::error_code cancel_scope::
  error (const state& s) noexcept
  {
    if (s.canceled.load (memory_order_acquire))
      return grab::error::canceled;

    if (s.deadline && clock::now () >= *s.deadline)
      return grab::error::deadline_exceeded;

    for (const auto& p: s.parents)
    {
      if (auto e = error (*p))
        return e;
    }

    return boost::system::error_code ();
  }

  optional<cancel_scope::time_point> cancel_scope::
  deadline () const noexcept
  {
    return deadline (*state_);
  }

  optional<cancel_scope::time_point> cancel_scope::
  deadline (const state& s) noexcept
  {
    optional<time_point> r (s.deadline);

    for (const auto& p: s.parents)
    {
      if (auto d = deadline (*p); d && (!r || *d < *r))
        r = d;
    }

    return r;
  }
}

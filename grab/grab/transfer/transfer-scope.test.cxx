#include <grab/transfer/transfer-scope.hxx>

#include <chrono>
#include <thread>
#include <cassert>
#include <iostream>

#include <grab/download/download-error.hxx>

using namespace std;
using namespace grab;

static void
test_cancel ()
{
  cancel_scope s;
  assert (!s.canceled ());
  assert (!s.error ());
  assert (!s.deadline ());

  // Copies share the state.
  //
  cancel_scope c (s);
  assert (c == s);

  c.cancel ();
  assert (s.canceled ());
  assert (s.error () == error::canceled);

  s.cancel (); // Idempotent.
  assert (s.error () == error::canceled);
}

static void
test_tree ()
{
  cancel_scope p;
  cancel_scope c (cancel_scope::with_cancel (p));
  cancel_scope g (cancel_scope::with_cancel (c));

  assert (!(c == p));

  // Never upwards.
  //
  g.cancel ();
  assert (g.canceled ());
  assert (!c.canceled () && !p.canceled ());

  cancel_scope o (cancel_scope::with_cancel (c));
  p.cancel ();
  assert (c.canceled () && o.canceled ());
  assert (o.error () == error::canceled);
}

static void
test_deadline ()
{
  cancel_scope p;
  cancel_scope d (cancel_scope::with_timeout (p, chrono::milliseconds (20)));
  cancel_scope c (cancel_scope::with_cancel (d));

  assert (d.deadline ());
  assert (c.deadline () == d.deadline ());
  assert (!c.canceled ());

  this_thread::sleep_for (chrono::milliseconds (40));

  assert (d.error () == error::deadline_exceeded);
  assert (c.error () == error::deadline_exceeded);
  assert (!p.canceled ());

  // The earliest deadline wins.
  //
  auto now (cancel_scope::clock::now ());
  cancel_scope x (cancel_scope::with_deadline (p, now + chrono::hours (2)));
  cancel_scope y (cancel_scope::with_deadline (x, now + chrono::hours (1)));
  cancel_scope z (cancel_scope::with_deadline (y, now + chrono::hours (3)));
  assert (*z.deadline () == now + chrono::hours (1));
}

static void
test_linked ()
{
  cancel_scope a;
  cancel_scope b;
  cancel_scope l (cancel_scope::linked (a, b));

  assert (!l.canceled ());
  b.cancel ();
  assert (l.canceled ());
  assert (!a.canceled ());

  // Linking a scope with itself is the same as deriving from it.
  //
  cancel_scope s;
  cancel_scope m (cancel_scope::linked (s, s));
  s.cancel ();
  assert (m.canceled ());
}

int
main ()
{
  test_cancel ();
  test_tree ();
  test_deadline ();
  test_linked ();
}

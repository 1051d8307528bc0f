#ifndef LOCK_HPP
#define LOCK_HPP

#include <ostream>
#include <string>

namespace locksmith {

class Locksmith;

// Lock is a held lease: the lock name, the uid the authority granted, and
// the Locksmith that acquired it. It never caches whether it is still valid;
// update() and release() always ask the authority and simply return false
// once the lease is gone.
class Lock {
private:
  Locksmith *locksmith;
  std::string lock_name;
  std::string lock_uid;

public:
  Lock(Locksmith &owner, std::string name, std::string uid);

  const std::string &name() const { return lock_name; }
  const std::string &uid() const { return lock_uid; }

  // Extends the lease for `validity` seconds from now. False if the lease
  // is unknown or expired.
  bool update(double validity) const;

  // False if the lease is unknown, expired or already released.
  bool release() const;

  // <Lock name='foo' uid='d1a96654-...'>
  std::string to_string() const;

  bool operator==(const Lock &other) const {
    return lock_name == other.lock_name && lock_uid == other.lock_uid;
  }
  bool operator!=(const Lock &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &os, const Lock &lock);

} // namespace locksmith

#endif

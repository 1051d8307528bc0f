#include "lock.hpp"
#include "locksmith.hpp"
#include <utility>

namespace locksmith {

Lock::Lock(Locksmith &owner, std::string name, std::string uid)
    : locksmith(&owner), lock_name(std::move(name)), lock_uid(std::move(uid)) {}

bool Lock::update(double validity) const {
  return locksmith->update(lock_uid, validity);
}

bool Lock::release() const { return locksmith->release(lock_uid); }

std::string Lock::to_string() const {
  return "<Lock name='" + lock_name + "' uid='" + lock_uid + "'>";
}

std::ostream &operator<<(std::ostream &os, const Lock &lock) {
  return os << lock.to_string();
}

} // namespace locksmith

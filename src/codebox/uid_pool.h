#ifndef CODEBOX_UID_POOL_H_
#define CODEBOX_UID_POOL_H_

// Every sandbox runs as a uid (and gid) of its own, leased from a fixed
// range for the lifetime of the lease. Blocks while the range is exhausted.
class UidLease {
  int uid_;
 public:
  UidLease();
  ~UidLease();
  UidLease(const UidLease&) = delete;
  UidLease& operator=(const UidLease&) = delete;

  int Uid() const { return uid_; }
};

#endif  // CODEBOX_UID_POOL_H_

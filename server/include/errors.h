#pragma once
#include <stdexcept>
#include <string>

namespace misato {

/*
Failure taxonomy
================

Only two failures travel as exceptions:

- HashingFailure   : the KDF rejected its inputs (bad salt length, unknown
                     parameter set, out of memory). Raised by hash_new /
                     hash_with_salt. verify() never lets it escape.

- StoreUnavailable : the account store could not complete a read or write.
                     It is propagated up to the route layer unchanged. It must
                     never be folded into "invalid credential", otherwise a
                     storage outage would look like a wrong password.

Wrong passwords and unknown/revoked tokens are ordinary outcomes (false /
empty optional), not exceptions.
*/
class HashingFailure : public std::runtime_error {
public:
    explicit HashingFailure(const std::string& what) : std::runtime_error(what) {}
};

class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};

} // namespace misato

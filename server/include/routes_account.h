#pragma once
#include <httplib.h>

#include <string>

namespace misato {
class AccountService;
} // namespace misato

// Objects owned by main.cpp; routes only borrow them.
struct RoutesAccountContext {
    misato::AccountService* accounts = nullptr;
    std::string service_name = "misato";
};

// Bearer token from "Authorization: Bearer <t>", else "X-Api-Key". Empty if none.
std::string bearer_token(const httplib::Request& req);

void register_routes_account(httplib::Server& srv, const RoutesAccountContext& ctx);

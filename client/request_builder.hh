#pragma once

#include <map>
#include <string>
#include <vector>

#include "graphlink.pb.h"

namespace graphlink {

class MutationBuilder {
public:
    MutationBuilder& set_json(const std::string& json);
    MutationBuilder& delete_json(const std::string& json);
    MutationBuilder& set_nquads(const std::string& nquads);
    MutationBuilder& del_nquads(const std::string& nquads);
    // Conditional upsert, e.g. "@if(eq(len(v), 0))".
    MutationBuilder& cond(const std::string& condition);

    const protocol::Mutation& mutation() const { return mutation_; }

private:
    protocol::Mutation mutation_;
};

// Builds the Request sent by Transaction::mutate; start_ts and hash are
// stamped by the transaction.
class RequestBuilder {
public:
    RequestBuilder& query(const std::string& query);
    RequestBuilder& vars(const std::map<std::string, std::string>& vars);
    RequestBuilder& commit_now(bool commit_now = true);
    RequestBuilder& with_mutation(const MutationBuilder& mutation);
    RequestBuilder& with_mutations(const std::vector<MutationBuilder>& mutations);

    const protocol::Request& request() const { return request_; }

private:
    protocol::Request request_;
};

} // namespace graphlink

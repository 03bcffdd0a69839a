#include "request_builder.hh"

namespace graphlink {

MutationBuilder& MutationBuilder::set_json(const std::string& json) {
    mutation_.set_set_json(json);
    return *this;
}

MutationBuilder& MutationBuilder::delete_json(const std::string& json) {
    mutation_.set_delete_json(json);
    return *this;
}

MutationBuilder& MutationBuilder::set_nquads(const std::string& nquads) {
    mutation_.set_set_nquads(nquads);
    return *this;
}

MutationBuilder& MutationBuilder::del_nquads(const std::string& nquads) {
    mutation_.set_del_nquads(nquads);
    return *this;
}

MutationBuilder& MutationBuilder::cond(const std::string& condition) {
    mutation_.set_cond(condition);
    return *this;
}

RequestBuilder& RequestBuilder::query(const std::string& query) {
    request_.set_query(query);
    return *this;
}

RequestBuilder& RequestBuilder::vars(const std::map<std::string, std::string>& vars) {
    auto* out = request_.mutable_vars();
    for (const auto& kv : vars) {
        (*out)[kv.first] = kv.second;
    }
    return *this;
}

RequestBuilder& RequestBuilder::commit_now(bool commit_now) {
    request_.set_commit_now(commit_now);
    return *this;
}

RequestBuilder& RequestBuilder::with_mutation(const MutationBuilder& mutation) {
    *request_.add_mutations() = mutation.mutation();
    return *this;
}

RequestBuilder& RequestBuilder::with_mutations(const std::vector<MutationBuilder>& mutations) {
    for (const auto& m : mutations) {
        with_mutation(m);
    }
    return *this;
}

} // namespace graphlink

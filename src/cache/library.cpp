#include <aarc/library.hpp>

namespace aarc {

std::future<Status> LocalOnlyFetcher::download(const std::string& project_name,
                                               const std::vector<Artifact>& remote) {
    std::promise<Status> done;
    if (remote.empty()) {
        done.set_value(ok_status());
    } else {
        done.set_value(AarcError{AarcError::Network,
            "project " + project_name + " declares " + std::to_string(remote.size())
            + " remote artifact(s) but no fetcher is configured",
            "first remote artifact: " + remote.front().describe()});
    }
    return done.get_future();
}

} // namespace aarc

#include "../include/clone_orchestrator.h"
#include "../include/checkout.h"
#include "../include/errors.h"
#include "../include/object_store.h"
#include "../include/packfile_decoder.h"
#include "../include/ref_protocol_client.h"
#include "../include/repository.h"

#include <iostream>
#include <vector>

CloneResult cloneRepository(Transport& transport, const std::string& remoteUrl, const std::filesystem::path& targetDir) {
    // --- 1. Local Repository Setup ---
    if (std::filesystem::exists(targetDir)) {
        if (!std::filesystem::is_directory(targetDir) || !std::filesystem::is_empty(targetDir)) {
            throw GitError("destination path '" + targetDir.string() + "' already exists and is not an empty directory");
        }
    }
    std::cerr << "Cloning into '" << targetDir.string() << "'...\n";
    std::filesystem::create_directories(targetDir);

    CloneResult result;
    result.gitDir = initRepository(targetDir);
    ObjectStore store(result.gitDir);

    // --- 2. Ref Discovery ---
    RefProtocolClient client(transport);
    const RefAdvertisement advertisement = client.discoverRefs(remoteUrl);

    // --- 3. Fetch one pack covering HEAD and every advertised ref ---
    std::vector<std::string> wanted = {advertisement.head};
    for (const auto& [name, sha] : advertisement.refs) {
        wanted.push_back(sha);
    }
    const std::vector<std::byte> packfile = client.fetchPack(remoteUrl, wanted);

    // --- 4. Decode the pack into the object store ---
    PackfileDecoder decoder(packfile, store);
    const PackDecodeResult decoded = decoder.decode();
    result.objectCount = decoded.objects.size();
    std::cerr << "Received " << decoded.objects.size() << " objects, " << decoded.written_count << " new.\n";

    // --- 5. Update Local References ---
    for (const auto& [name, sha] : advertisement.refs) {
        writeRef(result.gitDir, name, sha);
        ++result.refCount;
    }
    result.headSha = advertisement.head;
    result.headBranch = advertisement.headTarget;
    if (advertisement.headTarget) {
        writeSymbolicHead(result.gitDir, *advertisement.headTarget);
    } else {
        writeRef(result.gitDir, "HEAD", advertisement.head);
    }

    // --- 6. Checkout Files ---
    checkoutCommit(store, advertisement.head, targetDir);
    return result;
}

std::string defaultCloneDirectory(const std::string& remoteUrl) {
    std::string url = remoteUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    // Infer directory name from URL, e.g., https://github.com/user/repo.git -> repo
    std::string repoName = url.substr(url.find_last_of('/') + 1);
    if (repoName.ends_with(".git")) {
        repoName.resize(repoName.size() - 4);
    }
    return repoName;
}

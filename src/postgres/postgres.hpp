#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>

#include "utils.hpp"
#include "../persistence/folder_identity_repository.hpp"

// Feature vectors live in an `identity` table (pgvector column); the
// reference image stays in the users folder so per-identity reports have a
// home.
class PostgresIdentityRepository : public IdentityRepository {
    private:
        pqxx::connection conn;
        std::mutex conn_mutex;
        FolderIdentityRepository images;

        void ensure_schema();

    public:
        PostgresIdentityRepository(
            const std::string& host,
            const int& port,
            const std::string& dbname,
            const std::string& user,
            const std::string& password,
            const std::string& users_path
        );

        ~PostgresIdentityRepository() override;

        void save(const Identity& identity, const cv::Mat& reference_image) override;

        void remove(const std::string& name) override;

        std::vector<Identity> loadAll() override;
};

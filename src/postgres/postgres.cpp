#include "postgres.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

PostgresIdentityRepository::PostgresIdentityRepository(
    const std::string& host,
    const int& port,
    const std::string& dbname,
    const std::string& user,
    const std::string& password,
    const std::string& users_path
) : conn("host=" + host +
         " port=" + std::to_string(port) +
         " dbname=" + dbname +
         " user=" + user +
         " password=" + password),
    images(users_path, nullptr) {
    ensure_schema();
    std::cout << "Connected to identity database " << host << ":" << port << "/" << dbname << std::endl;
}

PostgresIdentityRepository::~PostgresIdentityRepository() {
    conn.close();
}

void PostgresIdentityRepository::ensure_schema() {
    pqxx::work txn(conn);
    txn.exec("CREATE EXTENSION IF NOT EXISTS vector");
    txn.exec(
        "CREATE TABLE IF NOT EXISTS identity ("
        "   name TEXT PRIMARY KEY, "
        "   embedding vector NOT NULL, "
        "   registered_at TIMESTAMPTZ NOT NULL DEFAULT now() "
        ")"
    );
    txn.commit();
}

void PostgresIdentityRepository::save(const Identity& identity, const cv::Mat& reference_image) {
    images.save(identity, reference_image);

    double registered_at = std::chrono::duration<double>(
        identity.registered_at.time_since_epoch()).count();
    try {
        std::lock_guard<std::mutex> lock(conn_mutex);
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO identity(name, embedding, registered_at) "
            "VALUES ($1, $2::vector, to_timestamp($3)) "
            "ON CONFLICT (name) DO UPDATE "
            "SET embedding = EXCLUDED.embedding, registered_at = EXCLUDED.registered_at",
            identity.name,
            vec2pgvector(identity.embedding),
            registered_at
        );
        txn.commit();
    } catch (const pqxx::failure& e) {
        throw std::runtime_error("Cannot store embedding for " + identity.name + ": " + e.what());
    }
}

void PostgresIdentityRepository::remove(const std::string& name) {
    try {
        std::lock_guard<std::mutex> lock(conn_mutex);
        pqxx::work txn(conn);
        txn.exec_params("DELETE FROM identity WHERE name = $1", name);
        txn.commit();
    } catch (const pqxx::failure& e) {
        throw std::runtime_error("Cannot delete " + name + ": " + e.what());
    }
    images.remove(name);
}

std::vector<Identity> PostgresIdentityRepository::loadAll() {
    std::vector<Identity> identities;

    std::lock_guard<std::mutex> lock(conn_mutex);
    pqxx::work txn(conn);
    pqxx::result r = txn.exec(
        "SELECT name, embedding::text AS embedding, "
        "       extract(epoch FROM registered_at) AS registered_at "
        "FROM identity "
        "ORDER BY registered_at, name"
    );
    txn.commit();

    for (const auto& row : r) {
        std::string name = row["name"].as<std::string>();
        try {
            auto since_epoch = std::chrono::duration<double>(row["registered_at"].as<double>());
            identities.push_back(Identity{
                name,
                pgvector2vec(row["embedding"].as<std::string>()),
                TimePoint(std::chrono::duration_cast<Clock::duration>(since_epoch))
            });
            std::cout << "Loaded user: " << name << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Error loading user " << name << ": " << e.what() << std::endl;
        }
    }
    return identities;
}

// JSON <-> engine structures. Request field names follow the HTTP API the
// daemon replaces (camelCase for tasks, snake_case for policies).
#pragma once
#include "openfleet/TaskTypes.hpp"
#include "openfleet/TransferPolicy.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <optional>
#include <string>
#include <vector>

// Request parsers. Fields absent from the JSON keep the value already in
// out, so callers can seed defaults from the config. err names the field.
bool parseBatchRequest(const QJsonObject &obj, openfleet::BatchRequest &out,
                       QString &err);
bool parseTransferRequest(const QJsonObject &obj,
                          openfleet::TransferRequest &out, QString &err);
bool parseTransferContext(const QJsonObject &obj,
                          openfleet::TransferContext &out, QString &err);
bool parsePolicy(const QJsonObject &obj, openfleet::TransferPolicy &out,
                 QString &err);
bool parsePolicyUpdate(const QJsonObject &obj, openfleet::PolicyUpdate &out,
                       QString &err);

// Stored payload (with a "kind" discriminator).
bool parsePayload(const QJsonObject &obj, openfleet::TaskPayload &out,
                  QString &err);
QJsonObject payloadToJson(const openfleet::TaskPayload &payload);

QJsonObject taskToJson(const openfleet::Task &task);
QJsonObject subTaskToJson(const openfleet::SubTask &st);
QJsonObject policyToJson(const openfleet::TransferPolicy &policy);
QJsonObject decisionToJson(const openfleet::PolicyDecision &decision);

// Extension lists as stored text: a JSON array of strings, or empty for no list.
QString extensionListToText(
    const std::optional<std::vector<std::string>> &list);
// False when text is neither empty nor a JSON array of strings; out is then
// left without a list.
bool extensionListFromText(const QString &text,
                           std::optional<std::vector<std::string>> &out);

// Reads a file holding one JSON object.
bool readJsonObjectFile(const QString &path, QJsonObject &out, QString &err);

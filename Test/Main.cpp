#include <fstream>
#include <iostream>
#include <string>
#include "Exporter/Resource.h"
#include "ExportOptions.hpp"
#include "cxxopts.hpp"
#include "ghc/filesystem.hpp"
#include "rapidjson/pointer.h"
#include "rapidjson/schema.h"
#include "NifMesh.h"

std::shared_ptr<Nif::Options> GetOptions(const std::string& content) {
    /*
     * Validate file json content.
     */
    rapidjson::Document document;
    if (document.Parse(content.c_str()).HasParseError() || !document.IsObject()) {
        LOG(Nif::Utils::ELogLevel::Error, "Invalid JSON input.");
        return nullptr;
    }

    static rapidjson::Document exportOptionsJsonSchemaDocument;
    if (exportOptionsJsonSchemaDocument.Parse(ExportOptionsJsonSchema.c_str()).HasParseError()) {
        std::string error = "Failed to parse json:" + std::to_string(exportOptionsJsonSchemaDocument.GetErrorOffset()) + " .";
        LOG(Nif::Utils::ELogLevel::Error, error);
        return nullptr;
    }
    static rapidjson::SchemaDocument schema(exportOptionsJsonSchemaDocument);
    rapidjson::SchemaValidator validator(schema);
    if (!document.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        std::string info = "Invalid keyword: " + std::string(validator.GetInvalidSchemaKeyword()) + ".\n  Invalid document: " + std::string(sb.GetString()) + ".";
        LOG(Nif::Utils::ELogLevel::Error, info);
        sb.Clear();
        validator.GetInvalidDocumentPointer().StringifyUriFragment(sb);
        std::string errorFragment = sb.GetString();
        LOG(Nif::Utils::ELogLevel::Error, "Schema error: " + errorFragment);
        return nullptr;
    }

    auto exportOptions = std::make_shared<Nif::Options>();

    if (document.HasMember("game")) {
        std::string gameName = document["game"].GetString();
        if (!Nif::GameProfile::FromName(gameName, exportOptions->game)) {
            LOG(Nif::Utils::ELogLevel::Error, "Unknown game profile: " + gameName + ".");
            return nullptr;
        }
    }
    if (document.HasMember("epsilon")) {
        exportOptions->epsilon = document["epsilon"].GetFloat();
    }
    if (document.HasMember("weightLossThreshold")) {
        exportOptions->weightLossThreshold = document["weightLossThreshold"].GetFloat();
    }

    if (document.HasMember("skin")) {
        auto& skinProperties = document["skin"];
        if (skinProperties.HasMember("maxBonesPerPartition")) {
            exportOptions->maxBonesPerPartition = skinProperties["maxBonesPerPartition"].GetUint();
        }
        if (skinProperties.HasMember("maxBonesPerVertex")) {
            exportOptions->maxBonesPerVertex = skinProperties["maxBonesPerVertex"].GetUint();
        }
        if (skinProperties.HasMember("padBones")) {
            exportOptions->bPadBones = skinProperties["padBones"].GetBool();
        }
        if (skinProperties.HasMember("weightFitPolicy")) {
            exportOptions->weightFitPolicy = static_cast<Nif::Options::EWeightFitPolicy>(skinProperties["weightFitPolicy"].GetInt());
        }
        if (skinProperties.HasMember("skeletonRoot")) {
            exportOptions->skeletonRootName = skinProperties["skeletonRoot"].GetString();
        }
        if (skinProperties.HasMember("sceneRoot")) {
            exportOptions->sceneRootName = skinProperties["sceneRoot"].GetString();
        }
        if (skinProperties.HasMember("bodyPartOrder")) {
            for (auto& bodyPart : skinProperties["bodyPartOrder"].GetArray()) {
                exportOptions->bodyPartOrder.push_back(bodyPart.GetInt());
            }
        }
    }

    if (document.HasMember("mesh")) {
        auto& meshProperties = document["mesh"];
        if (meshProperties.HasMember("exportTangents")) {
            exportOptions->bExportTangents = meshProperties["exportTangents"].GetBool();
        }
        if (meshProperties.HasMember("tangentOutput")) {
            exportOptions->tangentOutput = static_cast<Nif::Options::ETangentOutput>(meshProperties["tangentOutput"].GetInt());
        }
        if (meshProperties.HasMember("parallelMaterialGroups")) {
            exportOptions->bParallelMaterialGroups = meshProperties["parallelMaterialGroups"].GetBool();
        }
    }

    return exportOptions;
}

std::string ReadFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios_base::in);
    if (!file) {
        LOG(Nif::Utils::ELogLevel::Error, "Cannot read file: " + filePath);
        return "";
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("NifExporter", "Exports fbx meshes into NIF triangle shapes.");
    std::string inputFile;
    std::string outDirectory = "";
    std::string logFilePath = "";
    std::string configFileContent = "";
    std::string version = "0.1.0";

    try {
        // clang-format off
		options.add_options()
			("o,output", "Output directory", cxxopts::value<std::string>())
			("c,config", "Configuration file", cxxopts::value<std::string>())
			("l,log", "Log file path", cxxopts::value<std::string>())
			("f,file", "Input file", cxxopts::value<std::string>(), "FILE")
			("v", "Version");
        // clang-format on

        auto opts = options.parse(argc, argv);

        if (opts.count("v") != 0) {
            std::cout << version << std::endl;
            return 0;
        }

        if (opts.count("output") == 0) {
            LOG(Nif::Utils::ELogLevel::Error, "COULDN'T find <output> in command line parameters.");
            std::cout << options.help() << std::endl;
            return 1;
        }

        outDirectory = opts["output"].as<std::string>();

        if (opts.count("log") != 0) {
            logFilePath = opts["log"].as<std::string>();
        } else {
            logFilePath = (ghc::filesystem::path(outDirectory) / "nif.log").generic_string();
        }
        Nif::Utils::SetGlobalLogger(Nif::Utils::GetDefaultLogger(logFilePath));

        if (opts.count("f") == 0) {
            LOG(Nif::Utils::ELogLevel::Error, "COULDN'T find <f> in command line parameters.");
            std::cout << options.help() << std::endl;
            return 1;
        }
        inputFile = opts["f"].as<std::string>();

        if (opts.count("config") != 0) {
            configFileContent = ReadFile(opts["config"].as<std::string>());
        }

        std::shared_ptr<Nif::Options> exportOptions = nullptr;
        if (configFileContent != "") {
            exportOptions = GetOptions(configFileContent);
            if (!exportOptions) {
                LOG(Nif::Utils::ELogLevel::Warn, "Invalid configuration, default options are used.");
            }
        }
        if (!exportOptions) {
            exportOptions = std::make_shared<Nif::Options>();
        }

        LOG(Nif::Utils::ELogLevel::Info, "Programe ver: " + version + " .");
        LOG(Nif::Utils::ELogLevel::Info, "Input file: " + inputFile + " .");
        LOG(Nif::Utils::ELogLevel::Info, "Output directory: " + outDirectory + " .");
        LOG(Nif::Utils::ELogLevel::Info, "Log file: " + logFilePath + " .");
        LOG(Nif::Utils::ELogLevel::Info, "Game: " + Nif::GameProfile::GetName(exportOptions->game) + " .");

        Exporter::SetExportDirectory(outDirectory);
        auto shapes = Nif::ExportFbx(inputFile, exportOptions);
        for (auto& shape : shapes) {
            Exporter::TriShape triShape(shape);
            if (triShape.Export() == "") {
                LOG(Nif::Utils::ELogLevel::Error, "Failed to write shape " + shape->name + ".");
            }
        }
        if (!Exporter::ExportStore::SaveStorage(inputFile, *exportOptions)) {
            return 1;
        }
        LOG(Nif::Utils::ELogLevel::Info, "Exported " + std::to_string(shapes.size()) + " shapes.");
        return 0;
    } catch (const cxxopts::OptionException& e) {
        LOG(Nif::Utils::ELogLevel::Error, e.what());
        std::cout << options.help() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG(Nif::Utils::ELogLevel::Error, e.what());
        return 1;
    }
}

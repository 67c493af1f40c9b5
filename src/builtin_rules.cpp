#include "infrar/rules.hpp"

namespace infrar {

const char* builtin_rules_edn(){
    return R"EDN(
;; infrar.storage call-signature contract and native rules, version 1
{:version 1
 :signatures
 [{:module "infrar.storage" :name "upload"
   :params [{:name "bucket"} {:name "source"} {:name "destination"}]}
  {:module "infrar.storage" :name "download"
   :params [{:name "bucket"} {:name "source"} {:name "destination"}]}
  {:module "infrar.storage" :name "delete"
   :params [{:name "bucket"} {:name "path"}]}
  {:module "infrar.storage" :name "list_objects"
   :params [{:name "bucket"} {:name "prefix" :default "\"\""}]}]

 :rules
 [;; AWS S3 through boto3
  {:function "upload" :provider :aws
   :imports [{:module "boto3"}]
   :setup ["s3 = boto3.client('s3')"]
   :template "s3.upload_file({source}, {bucket}, {destination})"}
  {:function "download" :provider :aws
   :imports [{:module "boto3"}]
   :setup ["s3 = boto3.client('s3')"]
   :template "s3.download_file({bucket}, {source}, {destination})"}
  {:function "delete" :provider :aws
   :imports [{:module "boto3"}]
   :setup ["s3 = boto3.client('s3')"]
   :template "s3.delete_object(Bucket={bucket}, Key={key})"
   :params {:bucket "bucket" :path "key"}}
  {:function "list_objects" :provider :aws
   :imports [{:module "boto3"}]
   :setup ["s3 = boto3.client('s3')"]
   :template "s3.list_objects_v2(Bucket={bucket}, Prefix={prefix})"
   :no-capture true}

  ;; GCP Cloud Storage through google-cloud-storage
  {:function "upload" :provider :gcp
   :imports [{:module "google.cloud" :name "storage"}]
   :setup ["storage_client = storage.Client()"]
   :template "storage_client.bucket({bucket}).blob({destination}).upload_from_filename({source})"}
  {:function "download" :provider :gcp
   :imports [{:module "google.cloud" :name "storage"}]
   :setup ["storage_client = storage.Client()"]
   :template "storage_client.bucket({bucket}).blob({source}).download_to_filename({destination})"}
  {:function "delete" :provider :gcp
   :imports [{:module "google.cloud" :name "storage"}]
   :setup ["storage_client = storage.Client()"]
   :template "storage_client.bucket({bucket}).blob({path}).delete()"}
  {:function "list_objects" :provider :gcp
   :imports [{:module "google.cloud" :name "storage"}]
   :setup ["storage_client = storage.Client()"]
   :template "storage_client.list_blobs({bucket}, prefix={prefix})"
   :no-capture true}

  ;; Azure Blob Storage through azure-storage-blob
  {:function "upload" :provider :azure
   :imports [{:module "os"} {:module "azure.storage.blob" :name "BlobServiceClient"}]
   :setup ["blob_service_client = BlobServiceClient.from_connection_string(os.environ['AZURE_STORAGE_CONNECTION_STRING'])"]
   :template "blob_service_client.get_blob_client(container={bucket}, blob={destination}).upload_blob(open({source}, 'rb'), overwrite=True)"}
  {:function "download" :provider :azure
   :imports [{:module "os"} {:module "azure.storage.blob" :name "BlobServiceClient"}]
   :setup ["blob_service_client = BlobServiceClient.from_connection_string(os.environ['AZURE_STORAGE_CONNECTION_STRING'])"]
   :template "open({destination}, 'wb').write(blob_service_client.get_blob_client(container={bucket}, blob={source}).download_blob().readall())"}
  {:function "delete" :provider :azure
   :imports [{:module "os"} {:module "azure.storage.blob" :name "BlobServiceClient"}]
   :setup ["blob_service_client = BlobServiceClient.from_connection_string(os.environ['AZURE_STORAGE_CONNECTION_STRING'])"]
   :template "blob_service_client.get_blob_client(container={bucket}, blob={path}).delete_blob()"}
  {:function "list_objects" :provider :azure
   :imports [{:module "os"} {:module "azure.storage.blob" :name "BlobServiceClient"}]
   :setup ["blob_service_client = BlobServiceClient.from_connection_string(os.environ['AZURE_STORAGE_CONNECTION_STRING'])"]
   :template "blob_service_client.get_container_client({bucket}).list_blobs(name_starts_with={prefix})"
   :no-capture true}]}
)EDN";
}

} // namespace infrar

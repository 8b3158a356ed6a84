#pragma once

#include <string>

namespace relay {
namespace events {

class ContactDirectory;

// "5511999999999:12@s.whatsapp.net" -> "5511999999999"
std::string JidToPhone(const std::string& jid);

bool IsGroupId(const std::string& jid);
// 账号范围内的别名 id (@lid)
bool IsAliasId(const std::string& jid);

// 别名 id 在通讯录中有可路由的真实 id 时返回真实 id, 否则原样返回
std::string ResolveCounterparty(const std::string& jid, const ContactDirectory& directory);

// 名称优先级: 通讯录 name -> notify -> verified name -> push name -> 号码
std::string ContactName(const std::string& jid, const ContactDirectory& directory, const std::string& push_name);
std::string GroupName(const std::string& jid, const ContactDirectory& directory);

// 发送目标格式化: @g.us 原样, @c.us 换成 @s.whatsapp.net, 其他只保留数字
std::string FormatDestination(const std::string& to);

}
}

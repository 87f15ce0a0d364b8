#include "checkpoint.h"
#include "fileio.h"
#include "meta.h"
#include "debug.h"

#include <zlib.h>
#include <unistd.h>
#include <cstdio>

using namespace std;

namespace orca
{

static const string_view ckptHeader("#orcadl-checkpoint 1");

static void AddToken(mstring& line, string_view key, string_view value)
{
	if (!line.empty())
		line += ' ';
	line += key;
	line += '=';
	UrlEscapeAppend(value, line);
}

mstring FormatJobRecord(const tJobRecord& r)
{
	mstring ret;
	AddToken(ret, "id", r.id);
	AddToken(ret, "state", ToString(r.state));
	AddToken(ret, "kind", ToString(r.kind));
	AddToken(ret, "prio", to_string(r.priority));
	AddToken(ret, "seq", to_string(r.seq));
	AddToken(ret, "retries", to_string(r.retries));
	AddToken(ret, "created", to_string(r.created));
	AddToken(ret, "out", r.outputPath);
	if (!r.format.empty())
		AddToken(ret, "fmt", r.format);
	if (!r.checksum.empty())
		AddToken(ret, "sum", r.checksum);
	if (!r.resumeToken.empty())
		AddToken(ret, "token", r.resumeToken);
	if (!r.stagedPath.empty())
		AddToken(ret, "staged", r.stagedPath);
	for (const auto& u: r.uris)
		AddToken(ret, "uri", u);
	return ret;
}

bool ParseJobRecord(string_view line, tJobRecord& ret)
{
	ret = tJobRecord();
	bool haveState = false, haveKind = false, haveSeq = false;
	for (auto tok: tSplitWalk(line))
	{
		auto pos = tok.find('=');
		if (pos == stmiss)
			return false;
		auto key = tok.substr(0, pos);
		mstring val;
		if (!UrlUnescapeAppend(tok.substr(pos + 1), val))
			return false;
		if (key == "id")
			ret.id = val;
		else if (key == "state")
			haveState = FromString(val, ret.state);
		else if (key == "kind")
			haveKind = FromString(val, ret.kind);
		else if (key == "prio")
			ret.priority = (int) atoofft(val, 0);
		else if (key == "seq")
		{
			auto n = atoofft(val, -1);
			haveSeq = n > 0;
			ret.seq = n;
		}
		else if (key == "retries")
			ret.retries = (unsigned) max(off_t(0), atoofft(val, 0));
		else if (key == "created")
			ret.created = (time_t) atoofft(val, 0);
		else if (key == "out")
			ret.outputPath = val;
		else if (key == "fmt")
			ret.format = val;
		else if (key == "sum")
			ret.checksum = val;
		else if (key == "token")
			ret.resumeToken = val;
		else if (key == "staged")
			ret.stagedPath = val;
		else if (key == "uri")
			ret.uris.emplace_back(val);
		// unknown keys are from newer versions, ignored
	}
	return haveState && haveKind && haveSeq && !ret.id.empty() && !ret.outputPath.empty() && !ret.uris.empty();
}

bool SaveCheckpoint(cmstring& path, const std::vector<tJobRecord>& records, mstring& sErr)
{
	if (!mkbasedir(path))
	{
		sErr = tErrnoFmter("Cannot create state directory: ");
		return false;
	}
	auto tmp = path + ".tmp";
	auto gz = gzopen(tmp.c_str(), "wb6");
	if (!gz)
	{
		sErr = tErrnoFmter("Cannot create checkpoint file: ");
		return false;
	}
	bool ok = gzwrite(gz, ckptHeader.data(), ckptHeader.size()) > 0 && gzputc(gz, '\n') != -1;
	for (const auto& r: records)
	{
		if (!ok)
			break;
		auto line = FormatJobRecord(r);
		line += '\n';
		ok = gzwrite(gz, line.data(), line.size()) == (int) line.size();
	}
	if (gzclose(gz) != Z_OK)
		ok = false;
	if (!ok)
	{
		sErr = "Error writing checkpoint file " + tmp;
		unlink(tmp.c_str());
		return false;
	}
	if (0 != rename(tmp.c_str(), path.c_str()))
	{
		sErr = tErrnoFmter("Cannot replace checkpoint file: ");
		unlink(tmp.c_str());
		return false;
	}
	ldbg("Checkpoint with " << records.size() << " jobs written");
	return true;
}

bool LoadCheckpoint(cmstring& path, std::vector<tJobRecord>& ret, mstring& sErr)
{
	ret.clear();
	if (!Cstat(path))
		return true;
	auto gz = gzopen(path.c_str(), "rb");
	if (!gz)
	{
		sErr = tErrnoFmter("Cannot open checkpoint file: ");
		return false;
	}
	mstring data;
	char buf[16384];
	int n;
	while ((n = gzread(gz, buf, sizeof(buf))) > 0)
		data.append(buf, n);
	bool readError = n < 0;
	gzclose(gz);
	if (readError)
	{
		sErr = "Checkpoint file " + path + " is damaged";
		return false;
	}
	tSplitWalk lines(data, "\n");
	if (!lines.Next() || trimBoth(lines.view()) != ckptHeader)
	{
		sErr = "Not a checkpoint file: " + path;
		return false;
	}
	while (lines.Next())
	{
		auto line = trimBoth(lines.view());
		if (line.empty() || line[0] == '#')
			continue;
		tJobRecord rec;
		if (ParseJobRecord(line, rec))
			ret.emplace_back(move(rec));
		else
			log::err(tSS() << "Bad checkpoint line: " << line);
	}
	return true;
}

}
